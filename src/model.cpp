#include "../include/model.hpp"

#include <fmt/format.h>

namespace model
{
    auto kind_of(const Model &model) -> ModelKind
    {
        switch (model.index())
        {
        case 0:
            return ModelKind::Dfa;
        case 1:
            return ModelKind::Nfa;
        case 2:
            return ModelKind::EpsilonNfa;
        case 3:
            return ModelKind::Grammar;
        default:
            return ModelKind::Pda;
        }
    }

    auto to_string(ModelKind kind) -> std::string_view
    {
        switch (kind)
        {
        case ModelKind::Dfa:
            return "dfa";
        case ModelKind::Nfa:
            return "nfa";
        case ModelKind::EpsilonNfa:
            return "enfa";
        case ModelKind::Grammar:
            return "grammar";
        case ModelKind::Pda:
            return "pda";
        }
        return "unknown";
    }

    auto parse_model_kind(std::string_view name) -> Expected<ModelKind>
    {
        for (auto kind : {ModelKind::Dfa, ModelKind::Nfa, ModelKind::EpsilonNfa, ModelKind::Grammar, ModelKind::Pda})
        {
            if (to_string(kind) == name)
            {
                return kind;
            }
        }
        return make_error(ErrorKind::UnknownModelKind, "kind",
                          fmt::format("'{}' is not one of dfa, nfa, enfa, grammar, pda", name));
    }
}
