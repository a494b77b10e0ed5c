#include <rstore/store/container.h>
#include <rstore/store/middleware.h>
#include <rstore/util/errors.h>
#include <rstore/util/scope.h>

#include "../store_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <regex>
#include <string>
#include <vector>

using namespace rstore;
using rstore::test::counter_spec;

namespace {

    Middleware recording(std::string label, std::vector<std::string> &log) {
        return [label = std::move(label), &log](const spec_ptr &spec, const Next &next) {
            log.push_back(label + ">" + spec->name());
            auto instance = next(spec);
            log.push_back(label + "<" + spec->name());
            return instance;
        };
    }

    bool matches(const SpecPredicate &predicate, const std::string &name) {
        auto spec = counter_spec(Lifetime::KEEP_ALIVE, name);
        return predicate(*spec);
    }

}  // namespace

TEST_CASE("Middleware - wildcard patterns", "[middleware]") {
    auto prefix = to_predicate(SpecPattern{"user*"});
    REQUIRE(matches(prefix, "userProfile"));
    REQUIRE_FALSE(matches(prefix, "adminUser"));

    auto suffix = to_predicate(SpecPattern{"*Store"});
    REQUIRE(matches(suffix, "cartStore"));
    REQUIRE_FALSE(matches(suffix, "StoreFront"));

    auto infix = to_predicate(SpecPattern{"*auth*"});
    REQUIRE(matches(infix, "oauthToken"));
    REQUIRE(matches(infix, "auth"));
    REQUIRE_FALSE(matches(infix, "writer"));

    auto exact = to_predicate(SpecPattern{"cart"});
    REQUIRE(matches(exact, "cart"));
    REQUIRE_FALSE(matches(exact, "cartStore"));
}

TEST_CASE("Middleware - regex and pattern lists", "[middleware]") {
    auto regex = to_predicate(SpecPattern{std::regex{"^(cart|order)s?$"}});
    REQUIRE(matches(regex, "carts"));
    REQUIRE(matches(regex, "order"));
    REQUIRE_FALSE(matches(regex, "orderLine"));

    auto any = to_predicate(std::vector<SpecPattern>{std::string{"user*"}, std::regex{"Store$"}});
    REQUIRE(matches(any, "userList"));
    REQUIRE(matches(any, "cartStore"));
    REQUIRE_FALSE(matches(any, "settings"));
}

TEST_CASE("Middleware - the first middleware is outermost", "[middleware]") {
    std::vector<std::string> log;
    auto container = Container::create(ContainerOptions{
        .middleware = {recording("outer", log), recording("inner", log)},
    });

    static_cast<void>(container->get(counter_spec()));
    REQUIRE(log == std::vector<std::string>{"outer>counter", "inner>counter", "inner<counter", "outer<counter"});
}

TEST_CASE("Middleware - defaults wrap the container middleware", "[middleware][defaults]") {
    std::vector<std::string> log;
    auto earlier = Container::create();
    Container::defaults(DefaultMiddleware{.pre = {recording("pre", log)}, .post = {recording("post", log)}});
    auto reset = make_scope_exit([] { Container::clear_defaults(); });
    auto container = Container::create(ContainerOptions{.middleware = {recording("own", log)}});

    static_cast<void>(container->get(counter_spec()));
    REQUIRE(log == std::vector<std::string>{"pre>counter", "own>counter", "post>counter",
                                            "post<counter", "own<counter", "pre<counter"});

    SECTION("existing containers are unaffected") {
        log.clear();
        static_cast<void>(earlier->get(counter_spec()));
        REQUIRE(log.empty());
    }

    SECTION("inheriting scopes apply them once") {
        log.clear();
        static_cast<void>(container->scope()->get(counter_spec(Lifetime::KEEP_ALIVE, "scoped")));
        REQUIRE(log == std::vector<std::string>{"pre>scoped", "own>scoped", "post>scoped",
                                                "post<scoped", "own<scoped", "pre<scoped"});
    }

    SECTION("scopes with their own middleware keep the defaults around it") {
        log.clear();
        auto scope = container->scope(ScopeOptions{.middleware = std::vector<Middleware>{recording("local", log)}});
        static_cast<void>(scope->get(counter_spec(Lifetime::KEEP_ALIVE, "scoped")));
        REQUIRE(log == std::vector<std::string>{"pre>scoped", "local>scoped", "post>scoped",
                                                "post<scoped", "local<scoped", "pre<scoped"});
    }

    SECTION("clear_defaults stops applying them") {
        Container::clear_defaults();
        log.clear();
        static_cast<void>(Container::create()->get(counter_spec()));
        REQUIRE(log.empty());
    }
}

TEST_CASE("Middleware - compose preserves order", "[middleware]") {
    std::vector<std::string> log;
    auto container = Container::create(ContainerOptions{
        .middleware = {compose({recording("a", log), recording("b", log)}), recording("c", log)},
    });

    static_cast<void>(container->get(counter_spec()));
    REQUIRE(log == std::vector<std::string>{"a>counter", "b>counter", "c>counter",
                                            "c<counter", "b<counter", "a<counter"});
}

TEST_CASE("Middleware - empty compose passes through", "[middleware]") {
    auto passthrough = compose({});
    auto container = Container::create(ContainerOptions{.middleware = {passthrough}});
    auto instance = container->get(counter_spec());
    REQUIRE(instance->state()["count"].as_int() == 0);
}

TEST_CASE("Middleware - apply_for and apply_except select by name", "[middleware]") {
    std::vector<std::string> log;
    auto user = counter_spec(Lifetime::KEEP_ALIVE, "userStore");
    auto cart = counter_spec(Lifetime::KEEP_ALIVE, "cartStore");

    SECTION("apply_for") {
        auto container = Container::create(ContainerOptions{
            .middleware = {apply_for(SpecPattern{"user*"}, recording("only_user", log))},
        });
        static_cast<void>(container->get(user));
        static_cast<void>(container->get(cart));
        REQUIRE(log == std::vector<std::string>{"only_user>userStore", "only_user<userStore"});
    }

    SECTION("apply_except") {
        auto container = Container::create(ContainerOptions{
            .middleware = {apply_except(SpecPattern{"user*"}, recording("not_user", log))},
        });
        static_cast<void>(container->get(user));
        static_cast<void>(container->get(cart));
        REQUIRE(log == std::vector<std::string>{"not_user>cartStore", "not_user<cartStore"});
    }

    SECTION("predicate") {
        auto container = Container::create(ContainerOptions{
            .middleware = {apply_for([](const StoreSpec &spec) { return spec.name().starts_with("user"); },
                                     recording("short", log))},
        });
        static_cast<void>(container->get(user));
        static_cast<void>(container->get(cart));
        REQUIRE(log == std::vector<std::string>{"short>userStore", "short<userStore"});
    }
}

TEST_CASE("Middleware - can replace the built instance", "[middleware]") {
    auto real = counter_spec(Lifetime::KEEP_ALIVE, "api");
    auto stub = counter_spec(Lifetime::KEEP_ALIVE, "api_stub");
    auto container = Container::create(ContainerOptions{
        .middleware = {[stub](const spec_ptr &spec, const Next &next) {
            return spec->name() == "api" ? next(stub) : next(spec);
        }},
    });

    auto instance = container->get(real);
    REQUIRE(instance->spec() == stub);
    REQUIRE(container->get(real) == instance);
}

TEST_CASE("Middleware - a missing instance is an error", "[middleware][errors]") {
    auto container = Container::create(ContainerOptions{
        .middleware = {[](const spec_ptr &, const Next &) { return instance_ptr{}; }},
    });
    REQUIRE_THROWS_AS(container->get(counter_spec()), StoreError);
}
