#include "expression.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <sstream>
#include <stdexcept>

namespace rules_engine {

Expression Expression::makeLiteral(core::Value value) {
    Expression expr;
    expr.kind = Kind::Literal;
    expr.literal = std::move(value);
    return expr;
}

Expression Expression::makeLiteral(const char* text) {
    return makeLiteral(core::Value(std::string(text)));
}

Expression Expression::makeParameterRef(std::string parameter_name) {
    Expression expr;
    expr.kind = Kind::ParameterRef;
    expr.name = std::move(parameter_name);
    return expr;
}

Expression Expression::makeVariableRef(std::string variable_name) {
    Expression expr;
    expr.kind = Kind::VariableRef;
    expr.name = std::move(variable_name);
    return expr;
}

Expression Expression::makeCall(std::string function_id, std::vector<Expression> call_args) {
    Expression expr;
    expr.kind = Kind::FunctionCall;
    expr.name = std::move(function_id);
    expr.args = std::move(call_args);
    return expr;
}

Expression Expression::makeCoalesce(std::vector<Expression> operands) {
    if (operands.empty()) {
        throw std::invalid_argument("coalesce requires at least one operand.");
    }
    Expression expr;
    expr.kind = Kind::Coalesce;
    expr.args = std::move(operands);
    return expr;
}

Expression Expression::makeTemplate(std::vector<Expression> parts) {
    Expression expr;
    expr.kind = Kind::Template;
    expr.args = std::move(parts);
    return expr;
}

Expression Expression::makeRecord(std::vector<std::string> record_keys, std::vector<Expression> values) {
    if (record_keys.size() != values.size()) {
        throw std::invalid_argument("Record keys and values must have the same length.");
    }
    Expression expr;
    expr.kind = Kind::Record;
    expr.keys = std::move(record_keys);
    expr.args = std::move(values);
    return expr;
}

Expression Expression::makeTuple(std::vector<Expression> items) {
    Expression expr;
    expr.kind = Kind::Tuple;
    expr.args = std::move(items);
    return expr;
}

Expression Expression::makeDocument(nlohmann::json value) {
    Expression expr;
    expr.kind = Kind::Document;
    expr.document = std::move(value);
    return expr;
}

std::string Expression::describe() const {
    std::vector<std::string> parts;
    for (const auto& arg : args) {
        parts.push_back(arg.describe());
    }
    switch (kind) {
        case Kind::Literal:      return core::describe(literal);
        case Kind::Template:     return fmt::format("template({})", fmt::join(parts, " + "));
        case Kind::ParameterRef: return fmt::format("param:{}", name);
        case Kind::VariableRef:  return fmt::format("var:{}", name);
        case Kind::FunctionCall: return fmt::format("{}({})", name, fmt::join(parts, ", "));
        case Kind::Coalesce:     return fmt::format("coalesce({})", fmt::join(parts, ", "));
        case Kind::Record: {
            std::stringstream ss;
            ss << "{";
            for (std::size_t i = 0; i < keys.size(); ++i) {
                ss << (i ? ", " : "") << keys[i] << ": " << parts[i];
            }
            ss << "}";
            return ss.str();
        }
        case Kind::Tuple:        return fmt::format("[{}]", fmt::join(parts, ", "));
        case Kind::Document:     return document.dump();
        default:                 return "InvalidExpression";
    }
}

Expression parseTemplate(const std::string& text, const RefBinder& bind_ref) {
    std::vector<Expression> parts;
    std::string pending; // static text collected since the last placeholder

    auto flush_pending = [&]() {
        if (!pending.empty()) {
            parts.push_back(Expression::makeLiteral(pending));
            pending.clear();
        }
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                pending.push_back('{');
                ++i;
                continue;
            }
            std::size_t close = text.find('}', i + 1);
            if (close == std::string::npos) {
                throw std::invalid_argument(fmt::format("Unterminated placeholder in template '{}'", text));
            }
            std::string placeholder = text.substr(i + 1, close - i - 1);
            if (placeholder.empty()) {
                throw std::invalid_argument(fmt::format("Empty placeholder in template '{}'", text));
            }
            flush_pending();
            std::size_t hash = placeholder.find('#');
            if (hash == std::string::npos) {
                parts.push_back(bind_ref(placeholder));
            } else {
                std::string ref_name = placeholder.substr(0, hash);
                std::string path = placeholder.substr(hash + 1);
                if (ref_name.empty() || path.empty()) {
                    throw std::invalid_argument(fmt::format("Malformed placeholder '{{{}}}' in template '{}'", placeholder, text));
                }
                std::vector<Expression> call_args;
                call_args.push_back(bind_ref(ref_name));
                call_args.push_back(Expression::makeLiteral(path));
                parts.push_back(Expression::makeCall("getAttr", std::move(call_args)));
            }
            i = close;
        } else if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                pending.push_back('}');
                ++i;
                continue;
            }
            throw std::invalid_argument(fmt::format("Unbalanced '}}' in template '{}'", text));
        } else {
            pending.push_back(c);
        }
    }

    bool has_placeholder = false;
    for (const auto& part : parts) {
        if (part.kind != Expression::Kind::Literal) {
            has_placeholder = true;
        }
    }
    if (!has_placeholder) {
        // Only static text (possibly with escaped braces)
        std::string literal_text;
        for (const auto& part : parts) {
            literal_text += std::get<std::string>(part.literal);
        }
        return Expression::makeLiteral(literal_text + pending);
    }
    flush_pending();
    return Expression::makeTemplate(std::move(parts));
}

void forEachNode(const Expression& expr, const std::function<void(const Expression&)>& visit) {
    visit(expr);
    for (const auto& arg : expr.args) {
        forEachNode(arg, visit);
    }
}

} // namespace rules_engine
