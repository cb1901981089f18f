#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "render/debug_render.hpp"
#include "render/display_template.hpp"
#include "render/redacted_display.hpp"
#include "render/redacted_json.hpp"
#include "traversal/classifiable.hpp"
#include "traversal/plan_registry.hpp"
#include "traversal/shape_traits.hpp"
#include "traversal/traversal_plan.hpp"
#include "traversal/walker.hpp"

#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace redactkit {

/**
 * @brief Declares the traversal plan of an aggregate type
 *
 * Usage:
 *   PlanBuilder<User>(plans, "User")
 *       .pass_through("username", &User::username)
 *       .classify("password", &User::password, classification::kSecret)
 *       .recurse("age", &User::age)
 *       .register_plan();
 *
 * Each call validates its field on the spot (mode vs. field type, duplicate
 * names or members, unknown classifications) and composes the code that will
 * redact it. Problems are collected; register_plan() throws one
 * RegistrationError listing all of them, or hands the plan to the registry.
 *
 * T must be default-constructible: redact() starts from a value-initialized
 * T and assigns the bound fields. For an aggregate every member must be
 * bound exactly once; register_plan() reports the ones left out.
 */
template<typename T>
class PlanBuilder {
    static_assert(std::is_class_v<T>, "traversal plans describe class types");
    static_assert(std::is_default_constructible_v<T>,
                  "redacted copies are built from a value-initialized T");

public:
    PlanBuilder(PlanRegistry& plans, std::string type_name)
        : plans_(plans),
          plan_(std::make_shared<TraversalPlan<T>>(
              typename TraversalPlan<T>::ConstructionKey{}, type_name)),
          type_name_(std::move(type_name)) {
        if (type_name_.empty()) {
            diagnostics_.fail(ErrorCategory::CONFIG_ERROR, "type name must not be empty");
        }
    }

    PlanBuilder(const PlanBuilder&) = delete;
    PlanBuilder& operator=(const PlanBuilder&) = delete;

    /**
     * @brief Field copied unchanged (deep copy through boxes)
     */
    template<typename U>
    PlanBuilder& pass_through(std::string name, U T::*member) {
        if (!claim(name, member)) return *this;

        if constexpr (!is_clonable_v<U>) {
            field_error(name, ErrorCategory::INVALID_FIELD_MODE, std::format(
                "PassThrough on {} which cannot be copied", detail::type_label<U>()));
            return *this;
        } else {
            const PlanRegistry* plans = &plans_;
            plan_->add_binding(
                FieldDescriptor{name, FieldMode::PASS_THROUGH, std::nullopt},
                {
                    [member](const T& src, T& dst) { dst.*member = clone(src.*member); },
                    [member, plans](const T& src, std::string& out, std::string_view placeholder) {
                        detail::render_value(out, src.*member, *plans, placeholder);
                    },
                    json_binding(member),
                    display_binding(member),
                });
            return *this;
        }
    }

    /**
     * @brief Field walked recursively: nested plan, scalar default, or a
     * container of those
     */
    template<typename U>
    PlanBuilder& recurse(std::string name, U T::*member) {
        if (!claim(name, member)) return *this;

        const detail::FieldContext ctx{type_name_, name, diagnostics_};
        auto walker = detail::make_walker<T, U>(plans_, plan_.get(), ctx);
        if (!walker) return *this;

        plan_->add_binding(
            FieldDescriptor{name, FieldMode::RECURSE, std::nullopt},
            {
                [member, walker = std::move(walker)](const T& src, T& dst) {
                    dst.*member = walker(src.*member);
                },
                nullptr,
                json_binding(member),
                display_binding(member),
            });
        return *this;
    }

    /**
     * @brief Leaf (or container of leaves) transformed by the policy of
     * @p classification, looked up in the plan registry's classification
     * registry at redaction time
     */
    template<typename U>
    PlanBuilder& classify(std::string name, U T::*member, const Classification& classification) {
        if (!claim(name, member)) return *this;

        if constexpr (!is_classifiable_v<U>) {
            field_error(name, ErrorCategory::INVALID_FIELD_MODE, std::format(
                "Classify({}) on {} which is neither string-like nor scalar",
                classification.name(), detail::type_label<U>()));
            return *this;
        } else {
            const ClassificationRegistry* registry = &plans_.classifications();
            if (!registry->contains(classification)) {
                field_error(name, ErrorCategory::UNRESOLVED_CLASSIFICATION, std::format(
                    "no redaction policy registered for classification '{}'",
                    classification.name()));
                return *this;
            }

            plan_->add_binding(
                FieldDescriptor{name, FieldMode::CLASSIFY, classification},
                {
                    [member, registry, classification](const T& src, T& dst) {
                        dst.*member = classify_with(registry->resolve(classification), src.*member);
                    },
                    nullptr,
                    json_binding(member),
                    display_binding(member),
                });
            return *this;
        }
    }

    /**
     * @brief Text used by redacted_display(), e.g. "login failed for {user}"
     *
     * Placeholders name fields of this plan (see DisplayTemplate); they are
     * checked by register_plan(), so fields may be declared after this call.
     */
    PlanBuilder& display(std::string template_text) {
        if (registered_) {
            throw RegistrationError(ErrorCategory::INTERNAL_ERROR,
                std::format("Cannot set display template: plan for {} is already registered",
                            type_name_));
        }
        if (display_text_) {
            diagnostics_.fail(ErrorCategory::INVALID_TEMPLATE,
                std::format("{}: display template declared twice", type_name_));
            return *this;
        }
        display_text_ = std::move(template_text);
        return *this;
    }

    /**
     * @brief Validate and hand the plan to the registry
     * @throws RegistrationError listing every problem found, or the
     *         registry's error (duplicate type, frozen registry)
     */
    const TraversalPlan<T>& register_plan() {
        if (registered_) {
            throw RegistrationError(ErrorCategory::INTERNAL_ERROR,
                std::format("Traversal plan for {} was already registered", type_name_));
        }
        registered_ = true;

        if (display_text_) {
            std::vector<std::string> field_names;
            field_names.reserve(plan_->fields().size());
            for (const auto& f : plan_->fields()) {
                field_names.push_back(f.name);
            }
            auto parsed = DisplayTemplate::parse(*display_text_, field_names);
            if (parsed.is_ok()) {
                plan_->set_display_template(std::move(parsed.value()));
            } else {
                diagnostics_.fail(parsed.error_category(), std::format(
                    "{}: display template \"{}\": {}", type_name_, *display_text_,
                    parsed.error_message()));
            }
        }

        if constexpr (std::is_aggregate_v<T>) {
            constexpr size_t members = detail::member_count<T>();
            if (offsets_.size() < members) {
                diagnostics_.fail(ErrorCategory::MISSING_FIELD, std::format(
                    "{}: {} of {} members are bound; every member needs a field",
                    type_name_, offsets_.size(), members));
            }
        }

        if (!diagnostics_.ok()) {
            const std::string message = diagnostics_.summary(type_name_);
            utils::log::error(std::format("{} ({})", message,
                                          error_category_to_string(diagnostics_.category())));
            throw RegistrationError(diagnostics_.category(), message);
        }

        plans_.add(plan_);
        return *plan_;
    }

private:
    template<typename U>
    bool claim(const std::string& name, U T::*member) {
        static_assert(!std::is_const_v<U>, "const members cannot be assigned in the redacted copy");

        if (registered_) {
            throw RegistrationError(ErrorCategory::INTERNAL_ERROR,
                std::format("Cannot add field '{}': plan for {} is already registered",
                            name, type_name_));
        }
        if (name.empty()) {
            diagnostics_.fail(ErrorCategory::CONFIG_ERROR,
                std::format("{}: field name must not be empty", type_name_));
            return false;
        }
        if (member == nullptr) {
            field_error(name, ErrorCategory::CONFIG_ERROR, "null member pointer");
            return false;
        }
        if (!names_.insert(name).second) {
            field_error(name, ErrorCategory::DUPLICATE_FIELD, "field name declared twice");
            return false;
        }

        const auto* base = reinterpret_cast<const std::byte*>(std::addressof(probe_));
        const auto* field = reinterpret_cast<const std::byte*>(std::addressof(probe_.*member));
        if (!offsets_.insert(static_cast<size_t>(field - base)).second) {
            field_error(name, ErrorCategory::DUPLICATE_FIELD, "member already bound to another field");
            return false;
        }
        return true;
    }

    void field_error(const std::string& name, ErrorCategory category, std::string_view problem) {
        const detail::FieldContext ctx{type_name_, name, diagnostics_};
        ctx.fail(category, problem);
    }

    template<typename U>
    std::function<nlohmann::json(const T&)> json_binding(U T::*member) const {
        const PlanRegistry* plans = &plans_;
        return [member, plans](const T& value) {
            return detail::to_json_value(value.*member, *plans);
        };
    }

    template<typename U>
    std::function<void(const T&, std::string&, bool)> display_binding(U T::*member) const {
        const PlanRegistry* plans = &plans_;
        return [member, plans](const T& value, std::string& out, bool debug) {
            detail::display_value(out, value.*member, *plans, debug);
        };
    }

    PlanRegistry& plans_;
    std::shared_ptr<TraversalPlan<T>> plan_;
    std::string type_name_;

    detail::PlanDiagnostics diagnostics_;
    std::set<std::string> names_;
    std::set<size_t> offsets_;
    std::optional<std::string> display_text_;
    T probe_{};
    bool registered_ = false;
};

} // namespace redactkit
