#include "router/module_loader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <dlfcn.h>

namespace Bext {

namespace {

using ExportedFunction = void (*)(Context &);

std::string lastDlError() {
    const char *err = dlerror();
    return err != nullptr ? err : "unknown dynamic loader error";
}

} // namespace

const RouteHandler *RouteModule::find(const std::string &name) const {
    auto it = exports_.find(name);
    if (it == exports_.end() || !it->second) {
        return nullptr;
    }
    return &it->second;
}

std::vector<HttpMethod> RouteModule::exportedMethods() const {
    std::vector<HttpMethod> methods;
    for (HttpMethod method : kHttpMethods) {
        if (find(HttpMethodToString(method)) != nullptr) {
            methods.push_back(method);
        }
    }
    return methods;
}

std::shared_ptr<const RouteModule> SharedLibraryLoader::load(const std::string &file) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = modules_.find(file);
    if (cached != modules_.end()) {
        return cached->second;
    }

    dlerror();
    void *raw = dlopen(file.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (raw == nullptr) {
        throw RouteError("Failed to load route handler: " + file + ". Reason: " + lastDlError(),
                         ErrorCode::HANDLER_LOAD_ERROR);
    }
    std::shared_ptr<void> handle(raw, [](void *h) { dlclose(h); });

    std::vector<std::string> names;
    for (HttpMethod method : kHttpMethods) {
        names.push_back(HttpMethodToString(method));
    }
    names.push_back(kDefaultExport);

    RouteExports exports;
    for (const auto &name : names) {
        dlerror();
        void *symbol = dlsym(raw, name.c_str());
        if (symbol == nullptr) {
            continue;
        }
        auto fn = reinterpret_cast<ExportedFunction>(symbol);
        exports.emplace(name, [fn](Context &ctx) { fn(ctx); });
    }

    auto module = std::make_shared<const RouteModule>(file, std::move(exports), std::move(handle));
    modules_.emplace(file, module);
    defaultLogger().debug("Loaded route module " + file);
    return module;
}

size_t SharedLibraryLoader::loadedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_.size();
}

StaticModuleLoader &StaticModuleLoader::define(const std::string &file, RouteExports exports) {
    std::lock_guard<std::mutex> lock(mutex_);
    modules_[file] = std::make_shared<const RouteModule>(file, std::move(exports));
    return *this;
}

std::shared_ptr<const RouteModule> StaticModuleLoader::load(const std::string &file) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++load_count_;
    auto it = modules_.find(file);
    if (it == modules_.end()) {
        throw RouteError("Failed to load route handler: " + file + ". Reason: module is not defined",
                         ErrorCode::HANDLER_LOAD_ERROR);
    }
    return it->second;
}

size_t StaticModuleLoader::loadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_count_;
}

} // namespace Bext
