#include "errors.hpp"

namespace Bext {

auto describeError(const std::exception &e) -> std::string {
    const auto *bext = dynamic_cast<const BextError *>(&e);
    if (bext == nullptr || bext->code().empty()) {
        return e.what();
    }
    std::string out = "[" + bext->code() + "] " + e.what();
    const auto *validation = dynamic_cast<const RouteValidationError *>(&e);
    if (validation != nullptr && !validation->field().empty()) {
        out += " (field: " + validation->field() + ")";
    }
    return out;
}

} // namespace Bext
