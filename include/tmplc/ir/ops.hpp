// Template IR instructions ("ops"). A closed variant: passes dispatch with std::visit over
// a visitor that names every alternative, so a new op kind cannot silently skip a pass.
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "tmplc/ir/expression.hpp"
#include "tmplc/ir/variable.hpp"

namespace tmplc::ir
{

    enum class OpKind
    {
        ElementStart,
        ElementEnd,
        Text,
        Advance,
        Statement,
        Property,
        HostProperty,
        Listener,
        Variable,
        Template,
        RepeaterCreate,
        StyleProp,
        ClassProp
    };

    // Runtime storage index filled in by slot allocation (upstream of naming).
    struct SlotHandle
    {
        std::optional<int32_t> slot;
    };

    struct Op;
    using OpPtr = std::unique_ptr<Op>;
    using OpList = std::vector<OpPtr>;

    struct ElementStartOp
    {
        XrefId xref{0};
        std::string tag;
        SlotHandle handle;
    };
    struct ElementEndOp
    {
        XrefId xref{0};
    };
    struct TextOp
    {
        XrefId xref{0};
        std::string initial_value;
        SlotHandle handle;
    };
    struct AdvanceOp
    {
        int32_t delta{1};
    };
    struct StatementOp
    {
        ExprPtr expr;
    };
    struct PropertyOp
    {
        XrefId target{0};
        std::string name;
        ExprPtr expression;
        bool is_animation_trigger{false};
    };
    struct HostPropertyOp
    {
        std::string name;
        ExprPtr expression;
        bool is_animation_trigger{false};
    };
    struct ListenerOp
    {
        XrefId target{0};
        SlotHandle target_slot;
        std::optional<std::string> tag; // element tag; unset for host listeners
        std::string name;               // event name
        bool host_listener{false};
        bool is_animation_listener{false};
        std::string animation_phase;
        std::optional<std::string> handler_fn_name;
        OpList handler_ops;
    };
    struct VariableOp
    {
        XrefId xref{0};
        SemanticVariablePtr variable;
        ExprPtr initializer;
    };
    // Embedded view declared at `handle.slot`; `xref` is the child view.
    struct TemplateOp
    {
        XrefId xref{0};
        SlotHandle handle;
        std::string tag;
        std::string function_name_suffix;
    };
    // Repeater: `xref` is the primary view, `empty_view` the optional empty-state view.
    struct RepeaterCreateOp
    {
        XrefId xref{0};
        std::optional<XrefId> empty_view;
        SlotHandle handle;
        std::string tag;
        std::string function_name_suffix;
    };
    struct StylePropOp
    {
        XrefId target{0};
        std::string name;
        ExprPtr expression;
        std::optional<std::string> unit;
    };
    struct ClassPropOp
    {
        XrefId target{0};
        std::string name;
        ExprPtr expression;
    };

    // Alternative order matches OpKind.
    using op_data = std::variant<ElementStartOp, ElementEndOp, TextOp, AdvanceOp, StatementOp, PropertyOp,
                                 HostPropertyOp, ListenerOp, VariableOp, TemplateOp, RepeaterCreateOp,
                                 StylePropOp, ClassPropOp>;

    static_assert(std::variant_size_v<op_data> == static_cast<size_t>(OpKind::ClassProp) + 1,
                  "op_data alternatives must line up with OpKind");

    struct Op
    {
        op_data data;
        OpKind kind() const { return static_cast<OpKind>(data.index()); }
    };

    template <typename T>
    OpPtr make_op(T &&payload) { return std::make_unique<Op>(Op{op_data{std::forward<T>(payload)}}); }

    const char *to_string(OpKind k);

    // Visit every expression held directly by `op`. A listener holds none: its handler ops are visited as ops.
    void visit_expressions_in_op(Op &op, const std::function<void(Expression &)> &fn);

} // namespace tmplc::ir
