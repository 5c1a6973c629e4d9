#pragma once
#include <memory>
#include <optional>
#include <string>
#include "tmplc/ir/expression.hpp"

namespace tmplc::ir
{

    enum class SemanticVariableKind
    {
        Context,    // context object of a view
        Identifier, // a template-local identifier (let, #ref, loop item)
        SavedView   // snapshot of the current view, restored inside listeners
    };

    // Logical value declared by a Variable op. `name` is write-once: assigned by the naming phase.
    struct SemanticVariable
    {
        SemanticVariableKind kind{SemanticVariableKind::Context};
        std::string identifier;       // Identifier
        XrefId view{0};               // Context / SavedView
        std::optional<std::string> name;
    };

    using SemanticVariablePtr = std::shared_ptr<SemanticVariable>;

    inline SemanticVariablePtr context_variable(XrefId view)
    {
        auto v = std::make_shared<SemanticVariable>();
        v->kind = SemanticVariableKind::Context;
        v->view = view;
        return v;
    }
    inline SemanticVariablePtr identifier_variable(std::string identifier)
    {
        auto v = std::make_shared<SemanticVariable>();
        v->kind = SemanticVariableKind::Identifier;
        v->identifier = std::move(identifier);
        return v;
    }
    inline SemanticVariablePtr saved_view_variable(XrefId view)
    {
        auto v = std::make_shared<SemanticVariable>();
        v->kind = SemanticVariableKind::SavedView;
        v->view = view;
        return v;
    }

    const char *to_string(SemanticVariableKind k);

} // namespace tmplc::ir
