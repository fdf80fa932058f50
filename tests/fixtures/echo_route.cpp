#include "router/module_loader.hpp"

BEXT_ROUTE(GET) {
    ctx.json({{"id", ctx.param("id")}, {"loader", "shared"}});
}

BEXT_ROUTE(DEFAULT) {
    ctx.status(202).string("fallback " + ctx.env("STAGE", "none"));
}
