#ifndef BEXT_ROUTER_MODULE_LOADER_HPP
#define BEXT_ROUTER_MODULE_LOADER_HPP

#include "http/context.hpp"
#include "http/http_request.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/*
 * Declares a handler exported from a route module, e.g.
 *
 *     BEXT_ROUTE(GET) { ctx.json({{"id", ctx.param("id")}}); }
 */
#define BEXT_ROUTE(name) \
    extern "C" __attribute__((visibility("default"))) void name(::Bext::Context &ctx)

namespace Bext {

/* Fallback export used when the module has no function for the request method */
inline const std::string kDefaultExport = "DEFAULT";

using RouteExports = std::map<std::string, RouteHandler>;

class RouteModule {
public:
    RouteModule(std::string file, RouteExports exports, std::shared_ptr<void> handle = nullptr)
        : file_(std::move(file)), exports_(std::move(exports)), handle_(std::move(handle)) {}

    const std::string &file() const { return file_; }

    // nullptr when the module does not export `name`
    const RouteHandler *find(const std::string &name) const;

    /* Exported HTTP method handlers in canonical method order */
    std::vector<HttpMethod> exportedMethods() const;

private:
    std::string file_;
    RouteExports exports_;
    std::shared_ptr<void> handle_;  // keeps the shared object mapped
};

class ModuleLoader {
public:
    virtual ~ModuleLoader() = default;

    /* Throws RouteError(HANDLER_LOAD_ERROR) when the module cannot be loaded */
    virtual std::shared_ptr<const RouteModule> load(const std::string &file) = 0;
};

/*
 * Loads route modules built as shared objects. Every method symbol and the
 * DEFAULT symbol must have the signature `void(Bext::Context&)` with C linkage.
 * Loaded modules are memoized by path.
 */
class SharedLibraryLoader : public ModuleLoader {
public:
    std::shared_ptr<const RouteModule> load(const std::string &file) override;

    size_t loadedCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const RouteModule>> modules_;
};

/* Route modules linked into the process, registered by file path */
class StaticModuleLoader : public ModuleLoader {
public:
    StaticModuleLoader &define(const std::string &file, RouteExports exports);

    std::shared_ptr<const RouteModule> load(const std::string &file) override;

    /* Number of load() calls served, including failed ones */
    size_t loadCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const RouteModule>> modules_;
    size_t load_count_ = 0;
};

} // namespace Bext

#endif
