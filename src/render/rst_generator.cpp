//! # reStructuredText Generator
//!
//! Sphinx project output. Directive forms:
//!
//! ```rst
//! .. py:class:: Point
//!
//!    .. py:attribute:: Point.x
//!
//!       int128
//!
//! .. py:function:: transfer(to: address, amount: uint256) -> bool
//!
//!    Transfer tokens to a specified address.
//! ```

#include "log/log.hpp"
#include "render/generators.hpp"
#include "types/type.hpp"

#include <fstream>
#include <sstream>

namespace vydoc::render {

namespace fs = std::filesystem;

namespace {

/// Writes `text` with every non-empty line indented by `indent` spaces.
void write_block(const std::string& text, int indent, std::ostream& out) {
    std::istringstream lines(text);
    std::string line;
    std::string pad(static_cast<size_t>(indent), ' ');
    while (std::getline(lines, line)) {
        if (line.empty()) {
            out << "\n";
        } else {
            out << pad << line << "\n";
        }
    }
    out << "\n";
}

auto type_text(const types::Type& type) -> std::string {
    return types::type_to_string(type);
}

auto write_text_file(const fs::path& path, const std::string& text) -> bool {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out << text;
    return static_cast<bool>(out);
}

} // namespace

RstGenerator::RstGenerator(RenderConfig config) : config_(std::move(config)) {}

void RstGenerator::write_heading(const std::string& text, char underline,
                                 std::ostream& out) const {
    out << text << "\n" << std::string(text.size(), underline) << "\n\n";
}

// ============================================================================
// Project Files
// ============================================================================

void RstGenerator::generate_conf(std::ostream& out) const {
    out << "# Configuration file for Sphinx documentation\n\n";
    out << "project = '" << config_.project << "'\n";
    out << "copyright = '" << config_.copyright << "'\n";
    out << "author = '" << config_.author << "'\n\n";

    out << "extensions = [\n";
    for (size_t i = 0; i < config_.extensions.size(); ++i) {
        out << "    '" << config_.extensions[i] << "'";
        if (i + 1 < config_.extensions.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << "]\n\n";

    out << "templates_path = ['_templates']\n";
    out << "exclude_patterns = ['_build', 'Thumbs.db', '.DS_Store']\n\n";
    out << "html_theme = '" << config_.theme << "'\n";
    out << "html_static_path = ['_static']\n";
}

void RstGenerator::generate_index(const std::vector<model::Contract>& contracts,
                                  std::ostream& out) const {
    write_heading(config_.index_title(), '=', out);
    out << ".. toctree::\n";
    out << "   :maxdepth: 2\n";
    out << "   :caption: Contents:\n\n";
    for (const auto& contract : contracts) {
        out << "   " << contract.name << "\n";
    }
}

// ============================================================================
// Contract Pages
// ============================================================================

void RstGenerator::generate_contract(const model::Contract& contract, std::ostream& out) const {
    write_heading(contract.name, '=', out);

    if (contract.docstring) {
        out << *contract.docstring << "\n\n";
    }

    write_enums(contract, out);
    write_structs(contract, out);
    write_events(contract, out);
    write_constants(contract, out);
    write_variables(contract, out);

    auto external = contract.external_functions();
    if (!external.empty()) {
        write_heading("External Functions", '-', out);
        for (const auto* func : external) {
            write_function(*func, out);
        }
    }

    auto internal = contract.internal_functions();
    if (!internal.empty()) {
        write_heading("Internal Functions", '-', out);
        for (const auto* func : internal) {
            write_function(*func, out);
        }
    }
}

void RstGenerator::write_enums(const model::Contract& contract, std::ostream& out) const {
    if (contract.enums.empty()) {
        return;
    }
    write_heading("Enums", '-', out);
    for (const auto& e : contract.enums) {
        out << ".. py:class:: " << e.name << "\n\n";
        for (const auto& value : e.values) {
            out << "   .. py:attribute:: " << value << "\n\n";
        }
    }
}

void RstGenerator::write_structs(const model::Contract& contract, std::ostream& out) const {
    if (contract.structs.empty()) {
        return;
    }
    write_heading("Structs", '-', out);
    for (const auto& st : contract.structs) {
        out << ".. py:class:: " << st.name << "\n\n";
        for (const auto& field : st.fields) {
            out << "   .. py:attribute:: " << st.name << "." << field.name << "\n\n";
            out << "      " << type_text(field.type) << "\n\n";
        }
    }
}

void RstGenerator::write_events(const model::Contract& contract, std::ostream& out) const {
    if (contract.events.empty()) {
        return;
    }
    write_heading("Events", '-', out);
    for (const auto& event : contract.events) {
        out << ".. py:class:: " << event.name << "\n\n";
        for (const auto& field : event.fields) {
            out << "   .. py:attribute:: " << field.name << "\n\n";
            if (field.indexed) {
                out << "      indexed(" << field.type.name << ")\n\n";
            } else {
                out << "      " << field.type.name << "\n\n";
            }
        }
    }
}

void RstGenerator::write_constants(const model::Contract& contract, std::ostream& out) const {
    if (contract.constants.empty()) {
        return;
    }
    write_heading("Constants", '-', out);
    for (const auto& constant : contract.constants) {
        out << ".. py:data:: " << constant.name << "\n\n";
        out << "   " << type_text(constant.type) << ": " << constant.value << "\n\n";
    }
}

void RstGenerator::write_variables(const model::Contract& contract, std::ostream& out) const {
    if (contract.variables.empty()) {
        return;
    }
    write_heading("Variables", '-', out);
    for (const auto& var : contract.variables) {
        out << ".. py:attribute:: " << var.name << "\n\n";
        if (var.visibility == model::VariableVisibility::Public) {
            out << "   public(" << type_text(var.type) << ")\n\n";
        } else {
            out << "   " << type_text(var.type) << "\n\n";
        }
    }
}

void RstGenerator::write_function(const model::Function& func, std::ostream& out) const {
    out << ".. py:function:: " << func.name << "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << func.params[i].name << ": " << type_text(func.params[i].type);
    }
    out << ")";
    if (func.return_type) {
        out << " -> " << type_text(*func.return_type);
    }
    out << "\n\n";

    if (func.docstring) {
        write_block(*func.docstring, 3, out);
    }
}

// ============================================================================
// Directory Output
// ============================================================================

auto RstGenerator::generate_directory(const std::vector<model::Contract>& contracts,
                                      const fs::path& dir) const
    -> Result<std::vector<fs::path>, std::string> {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return "failed to create " + dir.string() + ": " + ec.message();
    }

    std::vector<fs::path> written;
    auto emit = [&](const fs::path& path, const std::string& text) -> bool {
        if (!write_text_file(path, text)) {
            return false;
        }
        VYDOC_LOG_DEBUG("render", "wrote " << path.string());
        written.push_back(path);
        return true;
    };

    std::ostringstream conf;
    generate_conf(conf);
    if (!emit(dir / "conf.py", conf.str())) {
        return "failed to write " + (dir / "conf.py").string();
    }

    std::ostringstream index;
    generate_index(contracts, index);
    if (!emit(dir / "index.rst", index.str())) {
        return "failed to write " + (dir / "index.rst").string();
    }

    for (const auto& contract : contracts) {
        std::ostringstream page;
        generate_contract(contract, page);
        auto path = dir / (contract.name + ".rst");
        if (!emit(path, page.str())) {
            return "failed to write " + path.string();
        }
    }

    VYDOC_LOG_INFO("render", "wrote " << written.size() << " file(s) to " << dir.string());
    return written;
}

} // namespace vydoc::render
