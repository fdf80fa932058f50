#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include "errors.hpp"
#include "router/parser.hpp"
#include "test_support.hpp"

void test_is_route_file() {
    assert(Bext::isRouteFile("index.so"));
    assert(Bext::isRouteFile("hello.so"));
    assert(Bext::isRouteFile("[id].so"));
    assert(Bext::isRouteFile("UPPER.SO"));

    /* Interface stubs and other extensions are not routes */
    assert(!Bext::isRouteFile("hello.stub.so"));
    assert(!Bext::isRouteFile("hello.cpp"));
    assert(!Bext::isRouteFile("hello.hpp"));
    assert(!Bext::isRouteFile("libhello.so.1"));
    assert(!Bext::isRouteFile("README"));
    assert(!Bext::isRouteFile("users"));
}

void test_parse_file_name() {
    auto index = Bext::parseFileName("index.so");
    assert(index.is_index);
    assert(index.name.empty());

    auto dynamic = Bext::parseFileName("[id].so");
    assert(!dynamic.is_index);
    assert(dynamic.name == "[id]");

    auto plain = Bext::parseFileName("hello.so");
    assert(!plain.is_index);
    assert(plain.name == "hello");

    /* Placeholder method set until the module is inspected */
    assert(plain.methods.size() == 1);
    assert(plain.methods[0] == Bext::HttpMethod::GET);
}

namespace {

bool matches(const std::shared_ptr<const Bext::CompiledPattern> &pattern, const std::string &path) {
    return Bext::matchRoutePattern(*pattern, path).has_value();
}

} // namespace

void test_compile_static_pattern() {
    auto compiled = Bext::compileRoutePattern("/api/hello");
    assert(compiled->keys.empty());
    assert(compiled->tokens.size() == 1);
    assert(matches(compiled, "/api/hello"));
    assert(matches(compiled, "/api/hello/"));
    assert(!matches(compiled, "/api/hello//"));
    assert(!matches(compiled, "/api/hello/x"));
    assert(!matches(compiled, "/api"));

    /* Dots and other punctuation are plain text */
    auto dotted = Bext::compileRoutePattern("/files/v1.0");
    assert(matches(dotted, "/files/v1.0"));
    assert(!matches(dotted, "/files/v1x0"));

    auto root = Bext::compileRoutePattern("/");
    assert(matches(root, "/"));
    assert(!matches(root, "/x"));

    bool empty = BextTest::throwsWith<Bext::RouteError>(
        [] { Bext::compileRoutePattern(""); },
        [](const Bext::RouteError &e) { return e.code() == Bext::ErrorCode::INVALID_PATTERN; });
    assert(empty);
}

void test_compile_bracket_pattern() {
    auto compiled = Bext::compileRoutePattern("/users/[id]");
    assert(compiled->keys.size() == 1);
    assert(compiled->keys[0] == "id");

    auto captures = Bext::matchRoutePattern(*compiled, "/users/42");
    assert(captures.has_value());
    assert(captures->size() == 1);
    assert((*captures)[0] == "42");

    assert(!matches(compiled, "/users/"));
    assert(!matches(compiled, "/users//"));
    assert(!matches(compiled, "/users/42/posts"));

    auto nested = Bext::compileRoutePattern("/orgs/[org]/repos/[repo]");
    assert(nested->keys.size() == 2);
    assert(nested->keys[0] == "org");
    assert(nested->keys[1] == "repo");
    auto both = Bext::matchRoutePattern(*nested, "/orgs/acme/repos/bext/");
    assert(both.has_value());
    assert((*both)[0] == "acme");
    assert((*both)[1] == "bext");

    /* Text sharing a segment with a parameter */
    auto suffixed = Bext::compileRoutePattern("/files/[name].json");
    auto file = Bext::matchRoutePattern(*suffixed, "/files/a.b.json");
    assert(file.has_value());
    assert((*file)[0] == "a.b");
    assert(!matches(suffixed, "/files/.json"));

    /* An unterminated bracket is literal text */
    auto literal = Bext::compileRoutePattern("/odd/[id");
    assert(literal->keys.empty());
    assert(matches(literal, "/odd/[id"));
}

void test_compile_legacy_pattern() {
    auto compiled = Bext::compileRoutePattern("/posts/:slug/comments/:id");
    assert(compiled->keys.size() == 2);
    assert(compiled->keys[0] == "slug");
    assert(compiled->keys[1] == "id");

    auto captures = Bext::matchRoutePattern(*compiled, "/posts/hello-world/comments/7");
    assert(captures.has_value());
    assert((*captures)[0] == "hello-world");
    assert((*captures)[1] == "7");
}

void test_repeated_parameter_names() {
    /* Legacy segments skip names already seen */
    auto legacy = Bext::compileRoutePattern("/a/:id/b/:id");
    assert(legacy->keys.size() == 1);
    assert(legacy->keys[0] == "id");
    auto first_wins = Bext::matchRoutePattern(*legacy, "/a/1/b/2");
    assert(first_wins.has_value());
    assert(first_wins->size() == 1);
    assert((*first_wins)[0] == "1");

    /* Bracket segments keep every occurrence */
    auto bracket = Bext::compileRoutePattern("/a/[id]/b/[id]");
    assert(bracket->keys.size() == 2);
    assert(bracket->keys[0] == "id");
    assert(bracket->keys[1] == "id");
    auto every = Bext::matchRoutePattern(*bracket, "/a/1/b/2");
    assert(every.has_value());
    assert(every->size() == 2);
    assert((*every)[1] == "2");
}

void test_long_segments() {
    const std::string id(200000, 'a');

    auto compiled = Bext::compileRoutePattern("/users/[id]");
    auto captures = Bext::matchRoutePattern(*compiled, "/users/" + id);
    assert(captures.has_value());
    assert((*captures)[0].size() == id.size());

    auto nested = Bext::compileRoutePattern("/users/[id]/posts");
    assert(matches(nested, "/users/" + id + "/posts"));
    assert(!matches(nested, "/users/" + id + "/comments"));
    assert(!matches(nested, "/users/" + id));

    auto fixed = Bext::compileRoutePattern("/static/page");
    assert(!matches(fixed, "/static/" + id));
}

void test_pattern_memoization() {
    auto first = Bext::compileRoutePattern("/memo/[id]");
    auto second = Bext::compileRoutePattern("/memo/[id]");
    assert(first.get() == second.get());
    assert(first->keys == second->keys);
    assert(first->tokens.size() == second->tokens.size());

    auto other = Bext::compileRoutePattern("/memo/[key]");
    assert(other.get() != first.get());
}

void test_load_route_methods() {
    auto loader = std::make_shared<Bext::StaticModuleLoader>();
    auto noop = [](Bext::Context &) {};
    loader->define("/routes/users.so", {{"POST", noop}, {"GET", noop}, {"DEFAULT", noop}});
    loader->define("/routes/empty.so", {{"DEFAULT", noop}, {"helper", noop}});

    auto methods = Bext::loadRouteMethods(*loader, "/routes/users.so");
    assert(methods.size() == 2);
    assert(methods[0] == Bext::HttpMethod::GET);
    assert(methods[1] == Bext::HttpMethod::POST);

    bool no_exports = BextTest::throwsWith<Bext::RouteError>(
        [&] { Bext::loadRouteMethods(*loader, "/routes/empty.so"); },
        [](const Bext::RouteError &e) { return e.code() == Bext::ErrorCode::MODULE_LOAD_ERROR; });
    assert(no_exports);

    bool missing = BextTest::throwsWith<Bext::RouteError>(
        [&] { Bext::loadRouteMethods(*loader, "/routes/missing.so"); },
        [](const Bext::RouteError &e) { return e.code() == Bext::ErrorCode::MODULE_LOAD_ERROR; });
    assert(missing);
}

int main() {
    test_is_route_file();
    test_parse_file_name();
    test_compile_static_pattern();
    test_compile_bracket_pattern();
    test_compile_legacy_pattern();
    test_repeated_parameter_names();
    test_long_segments();
    test_pattern_memoization();
    test_load_route_methods();

    std::cout << "all parser tests passed" << std::endl;
    return 0;
}
