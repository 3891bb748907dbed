//! # JSON Generator Tests

#include "render/generators.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace vydoc;
using namespace vydoc::render;
using vydoc::model::Contract;
using vydoc::types::ConstantBound;
using vydoc::types::IntegerBound;
using vydoc::types::Type;
namespace fs = std::filesystem;

class JsonGeneratorTest : public ::testing::Test {
protected:
    static auto make_vault() -> Contract {
        Contract contract;
        contract.name = "vault";
        contract.relative_path = "defi/vault.vy";

        contract.variables.push_back(model::Variable{
            "owners", Type::dyn_array("address", ConstantBound{"MAX_OWNERS", std::nullopt}),
            model::VariableVisibility::Public, 3, {}});

        model::Function split;
        split.name = "split";
        split.params = {{"ids", Type::dyn_array("uint256", IntegerBound{8})}};
        split.return_type = Type::tuple({Type::scalar("uint256"), Type::scalar("bool")});
        split.visibility = model::FunctionVisibility::External;
        split.line = 6;
        contract.functions.push_back(split);

        contract.diagnostics.push_back(model::Diagnostic{
            model::Severity::Error, "D001", "struct 'Open' has an unterminated body", 9});
        return contract;
    }

    static auto render(const std::vector<Contract>& contracts, RenderConfig config = {})
        -> std::string {
        JsonGenerator generator(config);
        std::ostringstream out;
        generator.generate(contracts, out);
        return out.str();
    }
};

TEST_F(JsonGeneratorTest, TopLevelKeys) {
    auto json = render({make_vault()});
    EXPECT_TRUE(json.starts_with("{\n  \"project\": \"Vyper Smart Contracts\",\n"));
    EXPECT_NE(json.find(std::string("\"version\": \"") + VERSION + "\""), std::string::npos);
    EXPECT_NE(json.find("\"contracts\": ["), std::string::npos);
    EXPECT_NE(json.find("\"name\": \"vault\""), std::string::npos);
    EXPECT_NE(json.find("\"path\": \"defi/vault.vy\""), std::string::npos);
}

TEST_F(JsonGeneratorTest, EmptyListsAndNullDocstring) {
    auto json = render({make_vault()});
    EXPECT_NE(json.find("\"docstring\": null"), std::string::npos);
    EXPECT_NE(json.find("\"enums\": []"), std::string::npos);
    EXPECT_NE(json.find("\"structs\": []"), std::string::npos);
    EXPECT_NE(json.find("\"events\": []"), std::string::npos);
    EXPECT_NE(json.find("\"constants\": []"), std::string::npos);
}

TEST_F(JsonGeneratorTest, NoContracts) {
    auto json = render({});
    EXPECT_NE(json.find("\"contracts\": []"), std::string::npos);
}

TEST_F(JsonGeneratorTest, StructuredTypes) {
    JsonGenerator generator(RenderConfig{.minify = true});
    std::ostringstream out;
    generator.generate(make_vault(), out);
    auto json = out.str();

    EXPECT_NE(json.find("{\"kind\":\"dynarray\",\"text\":\"DynArray[address, MAX_OWNERS]\","
                        "\"element\":\"address\","
                        "\"bound\":{\"constant\":\"MAX_OWNERS\",\"value\":null}}"),
              std::string::npos);
    EXPECT_NE(json.find("\"bound\":8}"), std::string::npos);
    EXPECT_NE(json.find("{\"kind\":\"tuple\",\"text\":\"(uint256, bool)\",\"elements\":["
                        "{\"kind\":\"scalar\",\"text\":\"uint256\"},"
                        "{\"kind\":\"scalar\",\"text\":\"bool\"}]}"),
              std::string::npos);
    EXPECT_NE(json.find("\"visibility\":\"public\""), std::string::npos);
    EXPECT_NE(json.find("\"visibility\":\"external\""), std::string::npos);
}

TEST_F(JsonGeneratorTest, ResolvedConstantBoundCarriesValue) {
    auto contract = make_vault();
    contract.variables[0].type = Type::dyn_array("address", ConstantBound{"MAX_OWNERS", "10"});
    auto json = render({contract}, RenderConfig{.minify = true});
    EXPECT_NE(json.find("\"bound\":{\"constant\":\"MAX_OWNERS\",\"value\":\"10\"}"),
              std::string::npos);
}

TEST_F(JsonGeneratorTest, Diagnostics) {
    auto json = render({make_vault()}, RenderConfig{.minify = true});
    EXPECT_NE(json.find("\"diagnostics\":[{\"severity\":\"error\",\"code\":\"D001\","
                        "\"message\":\"struct 'Open' has an unterminated body\",\"line\":9}]"),
              std::string::npos);
}

TEST_F(JsonGeneratorTest, EscapesStrings) {
    auto contract = make_vault();
    contract.docstring = "Line \"one\"\n\tpath C:\\vault";
    auto json = render({contract});
    EXPECT_NE(json.find(R"("docstring": "Line \"one\"\n\tpath C:\\vault")"), std::string::npos);
}

TEST_F(JsonGeneratorTest, MinifyRemovesWhitespace) {
    auto json = render({make_vault()}, RenderConfig{.minify = true});
    EXPECT_EQ(json.find('\n'), std::string::npos);
    EXPECT_TRUE(json.starts_with("{\"project\":\"Vyper Smart Contracts\","));
}

TEST_F(JsonGeneratorTest, GenerateFileCreatesParents) {
    auto dir = fs::temp_directory_path() / "vydoc_json_generator_test";
    fs::remove_all(dir);

    JsonGenerator generator;
    auto written = generator.generate_file({make_vault()}, dir / "docs" / "contracts.json");
    ASSERT_TRUE(is_ok(written));
    EXPECT_EQ(unwrap(written), dir / "docs" / "contracts.json");

    std::ifstream in(unwrap(written));
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), render({make_vault()}));

    fs::remove_all(dir);
}
