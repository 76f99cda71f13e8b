#include "test_helpers.hpp"

#include "../include/grammar_conversion.hpp"
#include "../include/simulator.hpp"

#include <gtest/gtest.h>

using namespace testing_helpers;

TEST(GrammarToDfa, EpsilonMarksTheVariableAccepting)
{
    auto grammar = make_grammar("S", "a, b", "S,aS,bS,λ", "S");
    auto dfa = unwrap(model::grammar_to_dfa(grammar));

    EXPECT_EQ(dfa.states(), (std::vector<std::string>{"S"}));
    EXPECT_EQ(dfa.accepting(), (model::StateSet{"S"}));
    EXPECT_EQ(dfa.next("S", "a"), std::optional<std::string>{"S"});
    EXPECT_EQ(dfa.next("S", "b"), std::optional<std::string>{"S"});
    for (const auto *word : {"", "a", "a,b", "b,b,a", "a,b,b,a"})
    {
        EXPECT_TRUE(model::simulate(dfa, symbols(word)).m_accepted) << word;
    }
}

TEST(GrammarToDfa, TerminalOnlyBodiesGoToTheFinalState)
{
    auto grammar = make_grammar("S, A", "a, b", "S,aA; A,b", "S");
    auto dfa = unwrap(model::grammar_to_dfa(grammar));

    EXPECT_EQ(dfa.states(), (std::vector<std::string>{"S", "A", "F"}));
    EXPECT_EQ(dfa.accepting(), (model::StateSet{"F"}));
    EXPECT_EQ(dfa.next("A", "b"), std::optional<std::string>{"F"});

    // partial: nothing leaves F
    EXPECT_FALSE(dfa.next("F", "a").has_value());
    EXPECT_FALSE(dfa.next("S", "b").has_value());

    EXPECT_TRUE(model::simulate(dfa, symbols("a,b")).m_accepted);

    auto longer = model::simulate(dfa, symbols("a,b,b"));
    EXPECT_FALSE(longer.m_accepted);
    EXPECT_EQ(longer.m_consumed, 2u);
    EXPECT_EQ(longer.m_path, (std::vector<std::string>{"S", "A", "F"}));
}

TEST(GrammarToDfa, FinalStateNameAvoidsVariables)
{
    auto grammar = make_grammar("S, F", "a, b", "S,aF,b; F,λ", "S");
    EXPECT_EQ(model::final_state_name(grammar), "F'");

    auto dfa = unwrap(model::grammar_to_dfa(grammar));
    EXPECT_EQ(dfa.states(), (std::vector<std::string>{"S", "F", "F'"}));
    EXPECT_EQ(dfa.accepting(), (model::StateSet{"F", "F'"}));
    EXPECT_EQ(dfa.next("S", "b"), std::optional<std::string>{"F'"});
}

TEST(GrammarToDfa, OnlyReachableVariablesBecomeStates)
{
    auto grammar = make_grammar("S, A, B", "a", "S,aA; A,λ; B,aB", "S");
    auto dfa = unwrap(model::grammar_to_dfa(grammar));

    EXPECT_EQ(dfa.states(), (std::vector<std::string>{"S", "A"}));
}

TEST(GrammarToDfa, RejectsNonDeterministicGrammar)
{
    auto grammar = make_grammar("S, A", "a", "S,aS,aA; A,λ", "S");
    auto dfa = model::grammar_to_dfa(grammar);

    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::NonDeterministicGrammar);
    EXPECT_EQ(dfa.error().m_field, "productions (S)");

    // a terminal-only body clashes with a t V body as well
    auto mixed = model::grammar_to_dfa(make_grammar("S", "a", "S,aS,a", "S"));
    ASSERT_FALSE(mixed.has_value());
    EXPECT_EQ(mixed.error().m_kind, ErrorKind::NonDeterministicGrammar);
}

TEST(DfaToGrammar, OneProductionPerTransition)
{
    auto dfa = make_dfa("q0, q1, q2", "0, 1",
                        "q0,0,q0; q0,1,q1; q1,0,q2; q1,1,q0; q2,0,q1; q2,1,q2", "q0", "q2");
    auto grammar = unwrap(model::dfa_to_grammar(dfa));

    EXPECT_EQ(grammar.start(), "q0");
    EXPECT_EQ(grammar.variables(), dfa.states());
    EXPECT_EQ(grammar.terminals(), dfa.alphabet());
    EXPECT_EQ(grammar.productions_of("q2"), (std::vector<model::ProductionBody>{
        model::ProductionBody("0", "q1"), model::ProductionBody("1", "q2"), model::ProductionBody::epsilon()}));

    EXPECT_EQ(model::format_grammar(grammar),
              "q0 → 0 q0 | 1 q1\n"
              "q1 → 0 q2 | 1 q0\n"
              "q2 → 0 q1 | 1 q2 | ε");
}

TEST(DfaToGrammar, PartialDfaGivesNoProductionsForMissingEntries)
{
    auto dfa = make_dfa("s, t", "a, b", "s,a,t", "s", "t");
    auto grammar = unwrap(model::dfa_to_grammar(dfa));

    EXPECT_EQ(grammar.productions_of("s"), (std::vector<model::ProductionBody>{model::ProductionBody("a", "t")}));
    EXPECT_EQ(grammar.productions_of("t"), (std::vector<model::ProductionBody>{model::ProductionBody::epsilon()}));
}

TEST(DfaToGrammar, ConvertsBackToTheSameLanguage)
{
    auto dfa = make_dfa("q0, q1, q2", "0, 1",
                        "q0,0,q0; q0,1,q1; q1,0,q2; q1,1,q0; q2,0,q1; q2,1,q2", "q0", "q2");
    auto back = unwrap(model::grammar_to_dfa(unwrap(model::dfa_to_grammar(dfa))));

    for (const auto *word : {"", "0", "1", "1,0", "1,1", "1,0,0", "1,0,1", "1,1,0,1"})
    {
        auto input = symbols(word);
        EXPECT_EQ(model::simulate(dfa, input).m_accepted, model::simulate(back, input).m_accepted) << word;
    }
}
