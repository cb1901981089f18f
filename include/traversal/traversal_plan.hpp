#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "render/display_template.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace redactkit {

template<typename T> class PlanBuilder;

/**
 * @brief One entry of a traversal plan
 */
struct FieldDescriptor {
    std::string name;
    FieldMode mode = FieldMode::PASS_THROUGH;
    std::optional<Classification> classification;   // set for CLASSIFY only
};

/**
 * @brief Type-independent view of a registered traversal plan
 */
class PlanBase {
public:
    virtual ~PlanBase() = default;

    PlanBase(const PlanBase&) = delete;
    PlanBase& operator=(const PlanBase&) = delete;

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] std::type_index type() const noexcept { return type_; }

    /**
     * @brief Fields in plan order
     */
    [[nodiscard]] const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

    /**
     * @brief Template set with PlanBuilder::display(), or nullptr
     */
    [[nodiscard]] const DisplayTemplate* display_template() const noexcept {
        return display_template_ ? &*display_template_ : nullptr;
    }

    [[nodiscard]] const FieldDescriptor* field(std::string_view name) const {
        for (const auto& f : fields_) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    /**
     * @brief Plan summary, e.g. "User { username: PassThrough, password: Classify(Secret) }"
     */
    [[nodiscard]] std::string describe() const {
        std::string out = type_name_;
        out += " {";
        for (size_t i = 0; i < fields_.size(); ++i) {
            out += i == 0 ? " " : ", ";
            out += fields_[i].name;
            out += ": ";
            out += field_mode_to_string(fields_[i].mode);
            if (fields_[i].classification) {
                out += '(';
                out += fields_[i].classification->name();
                out += ')';
            }
        }
        out += fields_.empty() ? "}" : " }";
        return out;
    }

protected:
    PlanBase(std::string type_name, std::type_index type)
        : type_name_(std::move(type_name)), type_(type) {}

    std::vector<FieldDescriptor> fields_;
    std::optional<DisplayTemplate> display_template_;

private:
    std::string type_name_;
    std::type_index type_;
};

/**
 * @brief Per-type traversal plan: ordered field bindings built by PlanBuilder
 *
 * Each binding was validated and specialized for its field type when the
 * plan was registered, so redact() does no type inspection and cannot fail.
 */
template<typename T>
class TraversalPlan final : public PlanBase {
public:
    /**
     * @brief Only PlanBuilder can name this, so only it constructs plans
     */
    class ConstructionKey {
        friend class PlanBuilder<T>;
        ConstructionKey() = default;
    };

    TraversalPlan(ConstructionKey, std::string type_name)
        : PlanBase(std::move(type_name), std::type_index(typeid(T))) {}

    /**
     * @brief Redacted copy of @p value
     *
     * The result starts value-initialized and each bound field is assigned
     * in plan order. The input is never modified.
     */
    [[nodiscard]] T redact(const T& value) const {
        T out{};
        for (const auto& binding : bindings_) {
            binding.apply(value, out);
        }
        return out;
    }

    /**
     * @brief Append "TypeName { field: value, ... }" to @p out
     *
     * Pass-through fields render their value; every other field renders the
     * quoted placeholder.
     */
    void render(const T& value, std::string& out, std::string_view placeholder) const {
        out += type_name();
        if (bindings_.empty()) return;

        out += " { ";
        for (size_t i = 0; i < bindings_.size(); ++i) {
            if (i > 0) out += ", ";
            out += fields_[i].name;
            out += ": ";
            if (bindings_[i].render) {
                bindings_[i].render(value, out, placeholder);
            } else {
                utils::append_quoted(out, placeholder);
            }
        }
        out += " }";
    }

    /**
     * @brief Append the display form of an already-redacted @p value
     *
     * With a display template and @p debug unset, the template's literals
     * and fields. Otherwise "TypeName { field: value, ... }" with every field
     * in debug form.
     */
    void display(const T& value, std::string& out, bool debug) const {
        if (display_template_ && !debug) {
            for (const auto& segment : display_template_->segments()) {
                out += segment.literal;
                if (segment.field) {
                    bindings_[*segment.field].display(value, out, segment.debug);
                }
            }
            return;
        }

        out += type_name();
        if (bindings_.empty()) return;

        out += " { ";
        for (size_t i = 0; i < bindings_.size(); ++i) {
            if (i > 0) out += ", ";
            out += fields_[i].name;
            out += ": ";
            bindings_[i].display(value, out, true);
        }
        out += " }";
    }

    /**
     * @brief JSON object keyed by field name, in plan order
     */
    [[nodiscard]] nlohmann::json to_json(const T& value) const {
        nlohmann::json object = nlohmann::json::object();
        for (size_t i = 0; i < bindings_.size(); ++i) {
            object[fields_[i].name] = bindings_[i].to_json(value);
        }
        return object;
    }

private:
    friend class PlanBuilder<T>;

    struct Binding {
        std::function<void(const T&, T&)> apply;
        std::function<void(const T&, std::string&, std::string_view)> render;  // empty: placeholder
        std::function<nlohmann::json(const T&)> to_json;
        std::function<void(const T&, std::string&, bool)> display;
    };

    void set_display_template(DisplayTemplate tmpl) {
        display_template_ = std::move(tmpl);
    }

    void add_binding(FieldDescriptor descriptor, Binding binding) {
        fields_.push_back(std::move(descriptor));
        bindings_.push_back(std::move(binding));
    }

    std::vector<Binding> bindings_;
};

namespace detail {

/**
 * @brief Collects every problem found while building one plan
 */
class PlanDiagnostics {
public:
    void fail(ErrorCategory category, std::string message) {
        if (errors_.empty()) {
            category_ = category;
        }
        errors_.push_back(std::move(message));
    }

    [[nodiscard]] bool ok() const noexcept { return errors_.empty(); }
    [[nodiscard]] size_t count() const noexcept { return errors_.size(); }
    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }
    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

    [[nodiscard]] std::string summary(std::string_view type_name) const {
        std::string combined = std::format("Invalid traversal plan for {}:", type_name);
        for (const auto& err : errors_) {
            combined += "\n  - ";
            combined += err;
        }
        return combined;
    }

private:
    ErrorCategory category_ = ErrorCategory::NONE;
    std::vector<std::string> errors_;
};

/**
 * @brief Where a walker is being composed, for diagnostics
 */
struct FieldContext {
    std::string_view type_name;
    std::string_view field;
    PlanDiagnostics& diagnostics;

    void fail(ErrorCategory category, std::string_view problem) const {
        diagnostics.fail(category, std::format("field '{}' of {}: {}", field, type_name, problem));
    }
};

template<typename T>
[[nodiscard]] std::string type_label() {
    return utils::demangle(typeid(T).name());
}

// ---- Aggregate member count ------------------------------------------------

/**
 * @brief Converts to any member type, so T{AnyMember{}, ...} compiles for as
 * many initializers as T has members
 */
struct AnyMember {
    template<typename U>
    operator U() const;
};

template<size_t>
using any_member_t = AnyMember;

template<typename T, size_t... I>
constexpr bool brace_constructible_with(std::index_sequence<I...>) {
    return requires { T{any_member_t<I>{}...}; };
}

/**
 * @brief Number of direct members of aggregate T
 *
 * Base classes count as one member each; a C array member counts once per
 * element (brace elision), which can only over-count.
 */
template<typename T, size_t N = 0>
constexpr size_t member_count() {
    static_assert(std::is_aggregate_v<T>, "member_count needs an aggregate");
    if constexpr (brace_constructible_with<T>(std::make_index_sequence<N + 1>{})) {
        return member_count<T, N + 1>();
    } else {
        return N;
    }
}

} // namespace detail

} // namespace redactkit
