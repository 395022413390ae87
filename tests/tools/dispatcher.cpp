#include "ssemcp/exceptions.hpp"
#include "ssemcp/tools/dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace ssemcp;

static tools::ToolRegistry make_registry()
{
    tools::ToolRegistry registry;
    Json text_schema = {{"type", "object"},
                        {"properties", Json{{"text", Json{{"type", "string"}}}}},
                        {"required", Json::array({"text"})}};
    registry.register_tool(tools::Tool{
        "echo", "Echo", text_schema,
        [](const Json& in) -> Json
        { return Json::array({Json{{"type", "text"}, {"text", "echo: " + in.at("text").get<std::string>()}}}); }});
    registry.register_tool(tools::Tool{"plain_string", "", Json::object(),
                                       [](const Json&) -> Json { return "just text"; }});
    registry.register_tool(tools::Tool{"single_block", "", Json::object(),
                                       [](const Json&) -> Json
                                       { return Json{{"type", "text"}, {"text", "one"}}; }});
    registry.register_tool(tools::Tool{"number", "", Json::object(),
                                       [](const Json&) -> Json { return 5; }});
    registry.register_tool(tools::Tool{"mixed", "", Json::object(),
                                       [](const Json&) -> Json
                                       { return Json::array({"a", Json{{"type", "text"}, {"text", "b"}}, 3}); }});
    registry.register_tool(tools::Tool{"boom", "", Json::object(),
                                       [](const Json&) -> Json
                                       { throw std::runtime_error("tool exploded"); }});
    registry.register_tool(tools::Tool{"args_echo", "", Json::object(),
                                       [](const Json& in) -> Json { return in.dump(); }});
    return registry;
}

template <typename E, typename Fn>
static bool throws(Fn fn)
{
    try
    {
        fn();
    }
    catch (const E&)
    {
        return true;
    }
    return false;
}

void test_success_shapes(const tools::ToolDispatcher& d)
{
    std::cout << "  test_success_shapes... " << std::flush;
    auto r = d.dispatch("echo", Json{{"text", "hi"}});
    assert(r["content"].size() == 1);
    assert(r["content"][0]["type"] == "text");
    assert(r["content"][0]["text"] == "echo: hi");

    assert(d.dispatch("plain_string", Json::object())["content"][0]["text"] == "just text");
    assert(d.dispatch("single_block", Json::object())["content"][0]["text"] == "one");
    assert(d.dispatch("number", Json::object())["content"][0]["text"] == "5");

    auto mixed = d.dispatch("mixed", Json::object())["content"];
    assert(mixed.size() == 3);
    assert(mixed[0]["text"] == "a");
    assert(mixed[1]["text"] == "b");
    assert(mixed[2]["text"] == "3");
    std::cout << "PASSED\n";
}

void test_argument_defaulting(const tools::ToolDispatcher& d)
{
    std::cout << "  test_argument_defaulting... " << std::flush;
    assert(d.dispatch("args_echo", Json())["content"][0]["text"] == "{}");
    assert(throws<ValidationError>([&] { d.dispatch("args_echo", Json::array({1})); }));
    std::cout << "PASSED\n";
}

void test_failures(const tools::ToolDispatcher& d)
{
    std::cout << "  test_failures... " << std::flush;
    assert(throws<NotFoundError>([&] { d.dispatch("missing", Json::object()); }));
    assert(throws<ValidationError>([&] { d.dispatch("echo", Json::object()); }));
    assert(throws<ValidationError>([&] { d.dispatch("echo", Json{{"text", 3}}); }));
    assert(throws<std::runtime_error>([&] { d.dispatch("boom", Json::object()); }));
    std::cout << "PASSED\n";
}

void test_validation_disabled(const tools::ToolRegistry& registry)
{
    std::cout << "  test_validation_disabled... " << std::flush;
    tools::ToolDispatcher lax(registry, false);
    // Schema check skipped: the tool's own at() lookup is what fails now
    bool threw_validation = throws<ValidationError>([&] { lax.dispatch("echo", Json::object()); });
    assert(!threw_validation);
    assert(throws<std::exception>([&] { lax.dispatch("echo", Json::object()); }));
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "ToolDispatcher tests\n";
    auto registry = make_registry();
    tools::ToolDispatcher dispatcher(registry);
    test_success_shapes(dispatcher);
    test_argument_defaulting(dispatcher);
    test_failures(dispatcher);
    test_validation_disabled(registry);
    std::cout << "All tests passed\n";
    return 0;
}
