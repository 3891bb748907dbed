//! # Contract Assembler Tests
//!
//! End-to-end extraction of whole files into a Contract.

#include "extract/assembler.hpp"

#include <gtest/gtest.h>

using namespace vydoc;
using namespace vydoc::extract;
using vydoc::model::FunctionVisibility;
using vydoc::model::Severity;
using vydoc::model::VariableVisibility;
using vydoc::source::Source;
using vydoc::types::ConstantBound;
using vydoc::types::DynArrayType;
using vydoc::types::IntegerBound;
using vydoc::types::Type;
using vydoc::types::TypeResolver;

class AssemblerTest : public ::testing::Test {
protected:
    TypeResolver resolver_;

    auto assemble_text(std::string code, std::string_view path = "token.vy")
        -> model::Contract {
        auto source = Source::from_string(std::move(code), std::string(path));
        return assemble(source, path, resolver_);
    }
};

TEST_F(AssemblerTest, Erc20Contract) {
    auto contract = assemble_text(R"(# @version 0.3.10
"""
ERC20 Token Implementation
"""

@external
def transfer(to: address, amount: uint256) -> bool:
    """
    Transfer tokens to a specified address.
    """
    return True

@external
@view
def balance_of(account: address) -> uint256:
    return 0
)");

    EXPECT_EQ(contract.name, "token");
    ASSERT_TRUE(contract.docstring.has_value());
    EXPECT_NE(contract.docstring->find("ERC20 Token Implementation"), std::string::npos);

    ASSERT_EQ(contract.functions.size(), 2u);
    const auto& transfer = contract.functions[0];
    EXPECT_EQ(transfer.name, "transfer");
    EXPECT_EQ(*transfer.return_type, Type::scalar("bool"));
    ASSERT_EQ(transfer.params.size(), 2u);
    EXPECT_EQ(transfer.params[0].type, Type::scalar("address"));
    EXPECT_EQ(transfer.params[1].type, Type::scalar("uint256"));
    EXPECT_EQ(*transfer.docstring, "Transfer tokens to a specified address.");

    EXPECT_EQ(contract.functions[1].name, "balance_of");
    EXPECT_TRUE(contract.all_diagnostics().empty());
}

TEST_F(AssemblerTest, AdjacentStorageVariables) {
    auto contract = assemble_text("owner: public(address)\nbalance: uint256\n");
    ASSERT_EQ(contract.variables.size(), 2u);
    EXPECT_EQ(contract.variables[0].name, "owner");
    EXPECT_EQ(contract.variables[0].type, Type::scalar("address"));
    EXPECT_EQ(contract.variables[0].visibility, VariableVisibility::Public);
    EXPECT_EQ(contract.variables[1].name, "balance");
    EXPECT_EQ(contract.variables[1].type, Type::scalar("uint256"));
    EXPECT_EQ(contract.variables[1].visibility, VariableVisibility::Private);
}

TEST_F(AssemblerTest, EmptyFile) {
    auto contract = assemble_text("", "nested/token.vy");
    EXPECT_EQ(contract.name, "token");
    EXPECT_EQ(contract.relative_path, "nested/token.vy");
    EXPECT_FALSE(contract.docstring.has_value());
    EXPECT_TRUE(contract.enums.empty());
    EXPECT_TRUE(contract.structs.empty());
    EXPECT_TRUE(contract.events.empty());
    EXPECT_TRUE(contract.constants.empty());
    EXPECT_TRUE(contract.variables.empty());
    EXPECT_TRUE(contract.functions.empty());
    EXPECT_TRUE(contract.diagnostics.empty());
    EXPECT_FALSE(contract.has_errors());
}

TEST_F(AssemblerTest, NameFallsBackToFilename) {
    auto source = Source::from_string("", "vault.vy");
    auto contract = assemble(source, "", resolver_);
    EXPECT_EQ(contract.name, "vault");
}

TEST_F(AssemblerTest, ConstantBoundsAreBound) {
    auto contract = assemble_text(R"(MAX_OWNERS: constant(uint256) = 10

struct Wallet:
    signers: DynArray[address, MAX_OWNERS]

owners: DynArray[address, MAX_OWNERS]
pending: DynArray[address, UNKNOWN]

@external
def set_owners(new_owners: DynArray[address, MAX_OWNERS]) -> DynArray[address, 3]:
    pass
)");

    auto bound_of = [](const Type& type) -> const ConstantBound& {
        return std::get<ConstantBound>(type.as<DynArrayType>().bound);
    };

    ASSERT_EQ(contract.variables.size(), 2u);
    EXPECT_EQ(bound_of(contract.variables[0].type).value, std::optional<std::string>("10"));
    EXPECT_FALSE(bound_of(contract.variables[1].type).is_resolved());

    ASSERT_EQ(contract.structs.size(), 1u);
    EXPECT_TRUE(bound_of(contract.structs[0].fields[0].type).is_resolved());

    ASSERT_EQ(contract.functions.size(), 1u);
    EXPECT_TRUE(bound_of(contract.functions[0].params[0].type).is_resolved());
    EXPECT_EQ(*contract.functions[0].return_type, Type::dyn_array("address", IntegerBound{3}));

    // An unresolved bound is not a diagnostic.
    EXPECT_TRUE(contract.all_diagnostics().empty());
}

TEST_F(AssemblerTest, BindConstantBoundsInsideTuples) {
    std::vector<model::Constant> constants = {
        model::Constant{"N", Type::scalar("uint256"), "4", 1, {}}};
    auto type = Type::tuple(
        {Type::scalar("bool"), Type::dyn_array("uint8", ConstantBound{"N", std::nullopt})});

    auto bound = bind_constant_bounds(type, constants);
    const auto& element = bound.as<types::TupleType>().elements[1];
    EXPECT_EQ(std::get<ConstantBound>(element.as<DynArrayType>().bound).value,
              std::optional<std::string>("4"));
}

TEST_F(AssemblerTest, ExternalFunctionsComeFirst) {
    auto contract = assemble_text(R"(@internal
def _a():
    pass

@external
def b():
    pass

@internal
def _c():
    pass

@external
def d():
    pass
)");
    ASSERT_EQ(contract.functions.size(), 4u);
    EXPECT_EQ(contract.functions[0].name, "b");
    EXPECT_EQ(contract.functions[1].name, "d");
    EXPECT_EQ(contract.functions[2].name, "_a");
    EXPECT_EQ(contract.functions[3].name, "_c");

    auto external = contract.external_functions();
    ASSERT_EQ(external.size(), 2u);
    EXPECT_EQ(external[0]->visibility, FunctionVisibility::External);
    EXPECT_EQ(contract.internal_functions().size(), 2u);
}

TEST_F(AssemblerTest, AssemblyIsRepeatable) {
    const std::string code = R"("""Vault."""
enum Mode:
    OPEN
    CLOSED
LIMIT: constant(uint256) = 5
event Deposit:
    who: indexed(address)
balances: HashMap[address, uint256]

@external
def deposit(items: DynArray[uint256, LIMIT]):
    pass
)";
    auto source = Source::from_string(code, "vault.vy");
    auto first = assemble(source, "vault.vy", resolver_);
    auto second = assemble(source, "vault.vy", resolver_);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.enums.size(), 1u);
    EXPECT_EQ(first.events.size(), 1u);
    EXPECT_NE(first.find_constant("LIMIT"), nullptr);
    EXPECT_EQ(first.find_constant("MISSING"), nullptr);
}

TEST_F(AssemblerTest, DiagnosticsAreAggregated) {
    auto contract = assemble_text(R"(struct Open { x: int128
label: String[16]

@external
def broken(x: uint256
)");
    EXPECT_TRUE(contract.has_errors());

    auto all = contract.all_diagnostics();
    ASSERT_EQ(all.size(), 3u);
    // Orphans first, then entity diagnostics.
    EXPECT_EQ(all[0].code, "D001");
    EXPECT_EQ(all[1].code, "D001");
    EXPECT_EQ(all[2].code, "T001");
    EXPECT_EQ(all[2].severity, Severity::Warning);
    EXPECT_EQ(contract.diagnostics.size(), 2u);
}
