//! # JSON Generator
//!
//! Machine-readable output: one document holding every contract. Types are
//! written structurally, with their source text alongside:
//!
//! ```json
//! {"kind": "dynarray", "text": "DynArray[address, MAX_OWNERS]",
//!  "element": "address", "bound": {"constant": "MAX_OWNERS", "value": "10"}}
//! ```
//!
//! Absent docstrings and return types are written as `null`.

#include "log/log.hpp"
#include "render/generators.hpp"
#include "types/type.hpp"

#include <cstdio>
#include <fstream>

namespace vydoc::render {

namespace fs = std::filesystem;

JsonGenerator::JsonGenerator(RenderConfig config) : config_(std::move(config)) {}

template <typename T, typename Fn>
void JsonGenerator::write_array(const std::vector<T>& items, std::ostream& out, int indent,
                                Fn&& write_one) {
    if (items.empty()) {
        out << "[]";
        return;
    }
    out << "[";
    write_newline(out);
    for (size_t i = 0; i < items.size(); ++i) {
        write_indent(out, indent + 1);
        write_one(items[i], indent + 1);
        if (i + 1 < items.size()) {
            out << ",";
        }
        write_newline(out);
    }
    write_indent(out, indent);
    out << "]";
}

void JsonGenerator::generate(const model::Contract& contract, std::ostream& out) {
    write_contract(contract, out, 0);
    write_newline(out);
}

void JsonGenerator::generate(const std::vector<model::Contract>& contracts, std::ostream& out) {
    out << "{";
    write_newline(out);

    write_key("project", out, 1);
    write_string(config_.project, out);
    out << ",";
    write_newline(out);

    write_key("version", out, 1);
    write_string(VERSION, out);
    out << ",";
    write_newline(out);

    write_key("contracts", out, 1);
    write_array(contracts, out, 1, [&](const model::Contract& contract, int indent) {
        write_contract(contract, out, indent);
    });
    write_newline(out);

    out << "}";
    write_newline(out);
}

auto JsonGenerator::generate_file(const std::vector<model::Contract>& contracts,
                                  const fs::path& path) -> Result<fs::path, std::string> {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return "failed to create " + path.parent_path().string() + ": " + ec.message();
        }
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return "failed to write " + path.string();
    }
    generate(contracts, out);
    if (!out) {
        return "failed to write " + path.string();
    }
    VYDOC_LOG_INFO("render", "wrote " << path.string());
    return path;
}

// ============================================================================
// Entities
// ============================================================================

void JsonGenerator::write_contract(const model::Contract& contract, std::ostream& out,
                                   int indent) {
    out << "{";
    write_newline(out);

    write_key("name", out, indent + 1);
    write_string(contract.name, out);
    out << ",";
    write_newline(out);

    write_key("path", out, indent + 1);
    write_string(contract.relative_path, out);
    out << ",";
    write_newline(out);

    write_key("docstring", out, indent + 1);
    if (contract.docstring) {
        write_string(*contract.docstring, out);
    } else {
        out << "null";
    }
    out << ",";
    write_newline(out);

    write_key("enums", out, indent + 1);
    write_array(contract.enums, out, indent + 1, [&](const model::Enum& e, int level) {
        out << "{";
        write_newline(out);
        write_key("name", out, level + 1);
        write_string(e.name, out);
        out << ",";
        write_newline(out);
        write_key("values", out, level + 1);
        write_array(e.values, out, level + 1,
                    [&](const std::string& value, int) { write_string(value, out); });
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
    out << ",";
    write_newline(out);

    write_key("structs", out, indent + 1);
    write_array(contract.structs, out, indent + 1, [&](const model::Struct& st, int level) {
        out << "{";
        write_newline(out);
        write_key("name", out, level + 1);
        write_string(st.name, out);
        out << ",";
        write_newline(out);
        write_key("fields", out, level + 1);
        write_params(st.fields, out, level + 1);
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
    out << ",";
    write_newline(out);

    write_key("events", out, indent + 1);
    write_array(contract.events, out, indent + 1, [&](const model::Event& event, int level) {
        out << "{";
        write_newline(out);
        write_key("name", out, level + 1);
        write_string(event.name, out);
        out << ",";
        write_newline(out);
        write_key("fields", out, level + 1);
        write_array(event.fields, out, level + 1, [&](const model::EventField& field, int inner) {
            out << "{";
            write_newline(out);
            write_key("name", out, inner + 1);
            write_string(field.name, out);
            out << ",";
            write_newline(out);
            write_key("type", out, inner + 1);
            write_type(types::Type::scalar(field.type.name), out, inner + 1);
            out << ",";
            write_newline(out);
            write_key("indexed", out, inner + 1);
            out << (field.indexed ? "true" : "false");
            write_newline(out);
            write_indent(out, inner);
            out << "}";
        });
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
    out << ",";
    write_newline(out);

    write_key("constants", out, indent + 1);
    write_array(contract.constants, out, indent + 1,
                [&](const model::Constant& constant, int level) {
                    out << "{";
                    write_newline(out);
                    write_key("name", out, level + 1);
                    write_string(constant.name, out);
                    out << ",";
                    write_newline(out);
                    write_key("type", out, level + 1);
                    write_type(constant.type, out, level + 1);
                    out << ",";
                    write_newline(out);
                    write_key("value", out, level + 1);
                    write_string(constant.value, out);
                    write_newline(out);
                    write_indent(out, level);
                    out << "}";
                });
    out << ",";
    write_newline(out);

    write_key("variables", out, indent + 1);
    write_array(contract.variables, out, indent + 1, [&](const model::Variable& var, int level) {
        out << "{";
        write_newline(out);
        write_key("name", out, level + 1);
        write_string(var.name, out);
        out << ",";
        write_newline(out);
        write_key("type", out, level + 1);
        write_type(var.type, out, level + 1);
        out << ",";
        write_newline(out);
        write_key("visibility", out, level + 1);
        write_string(std::string(model::variable_visibility_to_string(var.visibility)), out);
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
    out << ",";
    write_newline(out);

    write_key("functions", out, indent + 1);
    write_array(contract.functions, out, indent + 1, [&](const model::Function& func, int level) {
        out << "{";
        write_newline(out);
        write_key("name", out, level + 1);
        write_string(func.name, out);
        out << ",";
        write_newline(out);
        write_key("visibility", out, level + 1);
        write_string(std::string(model::function_visibility_to_string(func.visibility)), out);
        out << ",";
        write_newline(out);
        write_key("params", out, level + 1);
        write_params(func.params, out, level + 1);
        out << ",";
        write_newline(out);
        write_key("returns", out, level + 1);
        if (func.return_type) {
            write_type(*func.return_type, out, level + 1);
        } else {
            out << "null";
        }
        out << ",";
        write_newline(out);
        write_key("docstring", out, level + 1);
        if (func.docstring) {
            write_string(*func.docstring, out);
        } else {
            out << "null";
        }
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
    out << ",";
    write_newline(out);

    write_key("diagnostics", out, indent + 1);
    write_diagnostics(contract.all_diagnostics(), out, indent + 1);
    write_newline(out);

    write_indent(out, indent);
    out << "}";
}

void JsonGenerator::write_params(const std::vector<model::Parameter>& params, std::ostream& out,
                                 int indent) {
    write_array(params, out, indent, [&](const model::Parameter& param, int level) {
        out << "{";
        write_newline(out);
        write_key("name", out, level + 1);
        write_string(param.name, out);
        out << ",";
        write_newline(out);
        write_key("type", out, level + 1);
        write_type(param.type, out, level + 1);
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
}

/// `{"kind": "scalar"|"tuple"|"dynarray", "text": ..., ...}`
void JsonGenerator::write_type(const types::Type& type, std::ostream& out, int indent) {
    out << "{";
    write_newline(out);

    write_key("kind", out, indent + 1);
    if (type.is<types::ScalarType>()) {
        write_string("scalar", out);
    } else if (type.is<types::TupleType>()) {
        write_string("tuple", out);
    } else {
        write_string("dynarray", out);
    }
    out << ",";
    write_newline(out);

    write_key("text", out, indent + 1);
    write_string(types::type_to_string(type), out);

    if (type.is<types::TupleType>()) {
        out << ",";
        write_newline(out);
        write_key("elements", out, indent + 1);
        write_array(type.as<types::TupleType>().elements, out, indent + 1,
                    [&](const types::Type& element, int level) {
                        write_type(element, out, level);
                    });
    } else if (type.is<types::DynArrayType>()) {
        const auto& array = type.as<types::DynArrayType>();
        out << ",";
        write_newline(out);
        write_key("element", out, indent + 1);
        write_string(array.element.name, out);
        out << ",";
        write_newline(out);
        write_key("bound", out, indent + 1);
        if (const auto* literal = std::get_if<types::IntegerBound>(&array.bound)) {
            out << literal->value;
        } else {
            const auto& named = std::get<types::ConstantBound>(array.bound);
            out << "{";
            write_newline(out);
            write_key("constant", out, indent + 2);
            write_string(named.name, out);
            out << ",";
            write_newline(out);
            write_key("value", out, indent + 2);
            if (named.value) {
                write_string(*named.value, out);
            } else {
                out << "null";
            }
            write_newline(out);
            write_indent(out, indent + 1);
            out << "}";
        }
    }

    write_newline(out);
    write_indent(out, indent);
    out << "}";
}

void JsonGenerator::write_diagnostics(const std::vector<model::Diagnostic>& diagnostics,
                                      std::ostream& out, int indent) {
    write_array(diagnostics, out, indent, [&](const model::Diagnostic& diag, int level) {
        out << "{";
        write_newline(out);
        write_key("severity", out, level + 1);
        write_string(std::string(model::severity_to_string(diag.severity)), out);
        out << ",";
        write_newline(out);
        write_key("code", out, level + 1);
        write_string(diag.code, out);
        out << ",";
        write_newline(out);
        write_key("message", out, level + 1);
        write_string(diag.message, out);
        out << ",";
        write_newline(out);
        write_key("line", out, level + 1);
        out << diag.line;
        write_newline(out);
        write_indent(out, level);
        out << "}";
    });
}

// ============================================================================
// Primitives
// ============================================================================

void JsonGenerator::write_key(const char* key, std::ostream& out, int indent) {
    write_indent(out, indent);
    out << "\"" << key << "\":";
    if (!config_.minify) {
        out << " ";
    }
}

void JsonGenerator::write_string(const std::string& str, std::ostream& out) {
    out << "\"";
    for (char c : str) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 32) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out << buf;
            } else {
                out << c;
            }
            break;
        }
    }
    out << "\"";
}

void JsonGenerator::write_indent(std::ostream& out, int indent) {
    if (!config_.minify) {
        out << std::string(static_cast<size_t>(indent) * 2, ' ');
    }
}

void JsonGenerator::write_newline(std::ostream& out) {
    if (!config_.minify) {
        out << "\n";
    }
}

} // namespace vydoc::render
