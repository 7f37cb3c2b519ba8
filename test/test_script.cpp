#include <iostream>
#include <filesystem>
#include "script/script.h"
#include "script/script_serializer.h"
#include "common/error_handler.h"
#include "test_support.h"

using namespace emuflow;
using nlohmann::json;

namespace {

const char* LOGIN_SCRIPT = R"({
    "version": 1,
    "max_iterations": 50,
    "variables_global": {"attempts": 0},
    "sequence": [
        {"id": "c1", "name": "start", "type": "Click", "x": 100, "y": 200, "button_type": "Left"},
        {"id": "c2", "name": "find_ok", "type": "CropImage",
         "x1": 0, "y1": 0, "x2": 540, "y2": 960,
         "target_color": [0, 200, 0], "tolerance": 12, "scan_mode": "MaxMatch",
         "output_var": "ok_button", "on_fail": "GotoLabel", "on_fail_label": "start"},
        {"id": "c3", "name": "retry", "type": "Repeat", "count": 3,
         "until_condition_expr": "ok_button.found",
         "inner_commands": [
             {"id": "c3a", "name": "press_back", "type": "KeyPress", "key": "Back", "repeat": 1,
              "delay_between_ms": 0}
         ]},
        {"id": "c4", "name": "branch", "type": "Condition", "expr": "attempts > 2",
         "then_label": "start",
         "nested_else": [
             {"id": "c4a", "name": "type_user", "type": "Text", "content": "user", "text_mode": "Paste"}
         ]},
        {"id": "c5", "name": "settle", "type": "Wait", "wait_type": "Timeout", "timeout_sec": 0.5}
    ],
    "on_error_handler": {"id": "h1", "name": "go_home", "type": "KeyPress", "key": "Home"}
})";

Command clickNamed(const std::string& name) {
    return Command::create(name, ClickParams());
}

Command gotoNamed(const std::string& name, const std::string& label) {
    GotoParams params;
    params.targetLabel = label;
    return Command::create(name, params);
}

} // anonymous namespace

void testLoadDocument() {
    std::cout << "[TEST] Load Script Document\n";

    Script script = ScriptSerializer::fromJson(json::parse(LOGIN_SCRIPT));

    CHECK(script.sequence().size() == 5);
    CHECK(script.commandCount() == 8);
    CHECK(script.maxIterations() == 50);
    CHECK(script.variablesGlobal()["attempts"] == 0);
    CHECK(script.onErrorHandler() != nullptr);
    CHECK(script.onErrorHandler()->name == "go_home");

    const Command* crop = script.findById("c2");
    CHECK(crop != nullptr);
    const auto& cropParams = std::get<CropImageParams>(crop->params);
    CHECK(cropParams.region == Region(0, 0, 540, 960));
    CHECK(cropParams.targetColor == Rgb(0, 200, 0));
    CHECK(cropParams.scanMode == ScanMode::MAX_MATCH);
    CHECK(crop->onFail == OnFailAction::GOTO_LABEL);

    // Children written without parent_id are adopted by their owner
    const Command* inner = script.findById("c3a");
    CHECK(inner != nullptr);
    CHECK(inner->parentId && *inner->parentId == "c3");

    CHECK(*script.resolveLabel("start") == 0);
    CHECK(*script.resolveLabel("branch") == 3);
    CHECK(!script.resolveLabel("press_back"));
    CHECK(!script.resolveLabel("nothing"));
    CHECK(script.findByLabel("type_user")->id == "c4a");
    CHECK(script.labelMap().size() == 8);

    CHECK(script.expression("attempts > 2").evaluateBool(json{{"attempts", 3}}));
    CHECK_THROWS_AS(script.expression("never_compiled"), ConfigurationError);

    std::cout << "[OK] Load script document test passed\n\n";
}

void testDefaultsApplied() {
    std::cout << "[TEST] Field Defaults\n";

    json document = {
        {"sequence", json::array({
            {{"name", "tap"}, {"type", "Click"}},
            {{"name", "wait"}, {"type", "Wait"}}
        })}
    };
    Script script = ScriptSerializer::fromJson(document);

    CHECK(script.maxIterations() == Script::DEFAULT_MAX_ITERATIONS);
    CHECK(script.variablesGlobal().is_object());

    // A configured default replaces the built-in one, but never an explicit value
    CHECK(ScriptSerializer::fromJson(document, 250).maxIterations() == 250);
    json bounded = document;
    bounded["max_iterations"] = 40;
    CHECK(ScriptSerializer::fromJson(bounded, 250).maxIterations() == 40);
    CHECK_THROWS_AS(ScriptSerializer::fromJson(document, 0), ConfigurationError);
    CHECK(script.onErrorHandler() == nullptr);

    const Command& tap = script.sequence()[0];
    CHECK(tap.id.rfind("CMD-", 0) == 0);
    CHECK(tap.enabled);
    const auto& click = std::get<ClickParams>(tap.params);
    CHECK(click.humanizeDelayMinMs == 50);
    CHECK(click.humanizeDelayMaxMs == 200);
    CHECK(!click.wheelDelta);

    const auto& wait = std::get<WaitParams>(script.sequence()[1].params);
    CHECK(wait.waitType == WaitType::TIMEOUT);
    CHECK(wait.timeoutSec == 30.0);

    std::cout << "[OK] Field defaults test passed\n\n";
}

void testSaveAndReload() {
    std::cout << "[TEST] Save and Reload\n";

    Script original = ScriptSerializer::fromJson(json::parse(LOGIN_SCRIPT));
    json written = ScriptSerializer::toJson(original);

    CHECK(written["version"] == ScriptSerializer::FORMAT_VERSION);
    CHECK(written["sequence"][0]["wheel_delta"].is_null());
    CHECK(written["sequence"][1]["target_color"] == json::array({0, 200, 0}));
    CHECK(written["sequence"][4]["timeout_sec"] == 0.5);

    std::filesystem::path path = std::filesystem::temp_directory_path() / "emuflow_test_script.json";
    CHECK(ScriptSerializer::saveToFile(original, path.string()));
    Script reloaded = ScriptSerializer::loadFromFile(path.string());
    std::filesystem::remove(path);

    CHECK(ScriptSerializer::toJson(reloaded) == written);

    std::cout << "[OK] Save and reload test passed\n\n";
}

void testStructuralErrors() {
    std::cout << "[TEST] Structural Errors\n";

    {
        std::vector<Command> sequence;
        sequence.push_back(clickNamed("tap"));
        sequence.push_back(clickNamed("tap"));
        CHECK_THROWS_AS(Script(std::move(sequence)), ConfigurationError);
    }
    {
        std::vector<Command> sequence;
        Command first = clickNamed("a");
        Command second = clickNamed("b");
        second.id = first.id;
        sequence.push_back(first);
        sequence.push_back(second);
        CHECK_THROWS_AS(Script(std::move(sequence)), ConfigurationError);
    }
    {
        std::vector<Command> sequence;
        sequence.push_back(gotoNamed("jump", "missing"));
        try {
            Script script(std::move(sequence));
            CHECK(false);
        } catch (const ConfigurationError& e) {
            CHECK(std::string(e.what()).find("does not name any command") != std::string::npos);
        }
    }
    {
        // Jumps into a nested list are rejected
        RepeatParams repeat;
        repeat.count = 1;
        repeat.innerCommands.push_back(clickNamed("inner"));
        std::vector<Command> sequence;
        sequence.push_back(Command::create("loop", repeat));
        sequence.push_back(gotoNamed("jump", "inner"));
        try {
            Script script(std::move(sequence));
            CHECK(false);
        } catch (const ConfigurationError& e) {
            CHECK(std::string(e.what()).find("jump targets must be top level") != std::string::npos);
        }
    }
    {
        Command child = clickNamed("child");
        child.parentId = "somebody-else";
        RepeatParams repeat;
        repeat.innerCommands.push_back(child);
        std::vector<Command> sequence;
        sequence.push_back(Command::create("loop", repeat));
        CHECK_THROWS_AS(Script(std::move(sequence)), ConfigurationError);
    }
    {
        Command orphan = clickNamed("orphan");
        orphan.parentId = "CMD-x";
        std::vector<Command> sequence;
        sequence.push_back(orphan);
        CHECK_THROWS_AS(Script(std::move(sequence)), ConfigurationError);
    }
    {
        ConditionParams condition;
        condition.expr = "x >";
        std::vector<Command> sequence;
        sequence.push_back(Command::create("cond", condition));
        CHECK_THROWS_AS(Script(std::move(sequence)), ConfigurationError);
    }
    {
        std::vector<Command> sequence;
        sequence.push_back(clickNamed("tap"));
        CHECK_THROWS_AS(Script(std::move(sequence), json::object(), 0), ConfigurationError);
    }
    {
        std::vector<Command> sequence;
        CHECK_THROWS_AS(Script(std::move(sequence), json::array()), ConfigurationError);
    }

    std::cout << "[OK] Structural errors test passed\n\n";
}

void testNestingLimit() {
    std::cout << "[TEST] Nesting Limit\n";

    Command deepest = clickNamed("leaf");
    for (int depth = 0; depth <= Script::MAX_NESTING_LEVEL; ++depth) {
        RepeatParams repeat;
        repeat.count = 1;
        repeat.innerCommands.push_back(deepest);
        deepest = Command::create("level_" + std::to_string(depth), repeat);
    }
    std::vector<Command> sequence;
    sequence.push_back(deepest);
    CHECK_THROWS_AS(Script(std::move(sequence)), ConfigurationError);

    std::cout << "[OK] Nesting limit test passed\n\n";
}

void testDocumentErrors() {
    std::cout << "[TEST] Document Errors\n";

    CHECK_THROWS_AS(ScriptSerializer::fromJson(json::array()), ConfigurationError);
    CHECK_THROWS_AS(ScriptSerializer::fromJson(json{{"version", 2}}), ConfigurationError);
    CHECK_THROWS_AS(ScriptSerializer::fromJson(json{{"sequence", "nope"}}), ConfigurationError);
    CHECK_THROWS_AS(ScriptSerializer::fromJson(json{{"variables_global", 5}}), ConfigurationError);

    json missingType = {{"sequence", json::array({{{"name", "x"}}})}};
    CHECK_THROWS_AS(ScriptSerializer::fromJson(missingType), ConfigurationError);

    json badType = {{"sequence", json::array({{{"name", "x"}, {"type", "Swipe"}}})}};
    CHECK_THROWS_AS(ScriptSerializer::fromJson(badType), ConfigurationError);

    json badField = {{"sequence", json::array({{{"name", "x"}, {"type", "Click"}, {"x", "ten"}}})}};
    CHECK_THROWS_AS(ScriptSerializer::fromJson(badField), ConfigurationError);

    json badColor = {{"sequence", json::array({{{"name", "x"}, {"type", "CropImage"},
                                                 {"x2", 10}, {"y2", 10}, {"target_color", "red"}}})}};
    CHECK_THROWS_AS(ScriptSerializer::fromJson(badColor), ConfigurationError);

    CHECK_THROWS_AS(ScriptSerializer::loadFromFile("/nonexistent/emuflow/script.json"), ConfigurationError);

    std::cout << "[OK] Document errors test passed\n\n";
}

int main() {
    std::cout << "=== emuflow Script Test Suite ===\n\n";

    try {
        testLoadDocument();
        testDefaultsApplied();
        testSaveAndReload();
        testStructuralErrors();
        testNestingLimit();
        testDocumentErrors();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
