//! # Documentation Output Generators
//!
//! Turns a list of `Contract`s into documentation sources:
//!
//! - `RstGenerator`: a Sphinx project (`conf.py`, `index.rst`, one
//!   `<contract>.rst` per contract)
//! - `JsonGenerator`: a single JSON document for tooling
//!
//! Generators hold no parsing logic. Types are written in their source form
//! (`DynArray[uint256, MAX_OWNERS]`) whether a constant bound is resolved
//! or not.

#ifndef VYDOC_RENDER_GENERATORS_HPP
#define VYDOC_RENDER_GENERATORS_HPP

#include "common.hpp"
#include "model/contract.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace vydoc::render {

// ============================================================================
// Generator Configuration
// ============================================================================

/// Settings written into the generated Sphinx project.
struct RenderConfig {
    /// Project name; the index title derives from it.
    std::string project = "Vyper Smart Contracts";
    std::string author = "Vyper Developer";
    std::string copyright = "2023";
    std::string theme = "sphinx_rtd_theme";
    std::vector<std::string> extensions = {"sphinx.ext.autodoc", "sphinx.ext.napoleon",
                                           "sphinx.ext.viewcode"};
    bool minify = false; ///< Compact JSON output.

    /// "<project> Documentation"
    [[nodiscard]] auto index_title() const -> std::string {
        return project + " Documentation";
    }
};

// ============================================================================
// reStructuredText Generator
// ============================================================================

/// Generates a Sphinx documentation project.
///
/// Contract pages contain the sections Enums, Structs, Events, Constants,
/// Variables, External Functions and Internal Functions, in that order;
/// empty sections are left out.
class RstGenerator {
public:
    explicit RstGenerator(RenderConfig config = {});

    /// Sphinx `conf.py`.
    void generate_conf(std::ostream& out) const;

    /// `index.rst` with a toctree listing contract names in input order.
    void generate_index(const std::vector<model::Contract>& contracts, std::ostream& out) const;

    /// One contract page.
    void generate_contract(const model::Contract& contract, std::ostream& out) const;

    /// Writes the whole project into `dir`, creating it if needed.
    ///
    /// Returns the paths written, or a message naming the file that failed.
    [[nodiscard]] auto generate_directory(const std::vector<model::Contract>& contracts,
                                          const std::filesystem::path& dir) const
        -> Result<std::vector<std::filesystem::path>, std::string>;

private:
    RenderConfig config_;

    void write_heading(const std::string& text, char underline, std::ostream& out) const;
    void write_enums(const model::Contract& contract, std::ostream& out) const;
    void write_structs(const model::Contract& contract, std::ostream& out) const;
    void write_events(const model::Contract& contract, std::ostream& out) const;
    void write_constants(const model::Contract& contract, std::ostream& out) const;
    void write_variables(const model::Contract& contract, std::ostream& out) const;
    void write_function(const model::Function& func, std::ostream& out) const;
};

// ============================================================================
// JSON Generator
// ============================================================================

/// Generates JSON output holding every contract, its entities with
/// structured types, and all diagnostics.
class JsonGenerator {
public:
    explicit JsonGenerator(RenderConfig config = {});

    /// Generates JSON for a single contract.
    void generate(const model::Contract& contract, std::ostream& out);

    /// Generates `{"project": ..., "contracts": [...]}`.
    void generate(const std::vector<model::Contract>& contracts, std::ostream& out);

    /// Generates JSON to a file.
    [[nodiscard]] auto generate_file(const std::vector<model::Contract>& contracts,
                                     const std::filesystem::path& path)
        -> Result<std::filesystem::path, std::string>;

private:
    RenderConfig config_;

    void write_contract(const model::Contract& contract, std::ostream& out, int indent);
    void write_type(const types::Type& type, std::ostream& out, int indent);
    void write_params(const std::vector<model::Parameter>& params, std::ostream& out,
                      int indent);
    void write_diagnostics(const std::vector<model::Diagnostic>& diagnostics, std::ostream& out,
                           int indent);
    void write_key(const char* key, std::ostream& out, int indent);
    void write_string(const std::string& str, std::ostream& out);
    void write_indent(std::ostream& out, int indent);
    void write_newline(std::ostream& out);

    template <typename T, typename Fn>
    void write_array(const std::vector<T>& items, std::ostream& out, int indent, Fn&& write_one);
};

} // namespace vydoc::render

#endif // VYDOC_RENDER_GENERATORS_HPP
