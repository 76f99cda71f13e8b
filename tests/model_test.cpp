#include "test_helpers.hpp"

#include "../include/automaton.hpp"
#include "../include/grammar.hpp"
#include "../include/pushdown_automaton.hpp"

#include <gtest/gtest.h>

using namespace testing_helpers;

namespace
{
    auto dfa_record(std::string transitions, std::string start = "q0", std::string accepting = "q2") -> parser::InputRecord
    {
        return record(model::ModelKind::Dfa, {
            {"states", "q0, q1, q2"}, {"alphabet", "0, 1"}, {"transitions", transitions},
            {"start", start}, {"accepting", accepting}});
    }
}

TEST(DfaModel, BuildsFromRecord)
{
    auto dfa = make_dfa("q0, q1, q2", "0, 1", "q0,0,q0; q0,1,q1; q1,0,q2; q1,1,q0; q2,0,q1; q2,1,q2", "q0", "q2");

    EXPECT_EQ(dfa.states(), (std::vector<std::string>{"q0", "q1", "q2"}));
    EXPECT_EQ(dfa.alphabet(), (std::vector<std::string>{"0", "1"}));
    EXPECT_EQ(dfa.start(), "q0");
    EXPECT_TRUE(dfa.is_accepting("q2"));
    EXPECT_FALSE(dfa.is_accepting("q0"));
    EXPECT_EQ(dfa.transitions().size(), 6u);
    EXPECT_EQ(dfa.next("q1", "0"), std::optional<std::string>{"q2"});
}

TEST(DfaModel, PartialFunctionLeavesMissingEntriesUndefined)
{
    auto dfa = make_dfa("s, t", "a, b", "s,a,t", "s", "t");
    EXPECT_EQ(dfa.next("s", "a"), std::optional<std::string>{"t"});
    EXPECT_FALSE(dfa.next("s", "b").has_value());
    EXPECT_FALSE(dfa.next("t", "a").has_value());
}

TEST(DfaModel, DuplicateDeclarationsCollapse)
{
    auto dfa = make_dfa("q0, q1, q0", "a, a", "q0,a,q1", "q0", "q1");
    EXPECT_EQ(dfa.states(), (std::vector<std::string>{"q0", "q1"}));
    EXPECT_EQ(dfa.alphabet(), (std::vector<std::string>{"a"}));
}

TEST(DfaModel, UndeclaredStateInTransition)
{
    auto dfa = parser::to_dfa(dfa_record("q0,0,q9"));
    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(dfa.error().m_field, "transitions[0]");
    EXPECT_NE(dfa.error().m_detail.find("q9"), std::string::npos);
}

TEST(DfaModel, UndeclaredSymbolInTransition)
{
    auto dfa = parser::to_dfa(dfa_record("q0,0,q1; q1,x,q2"));
    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(dfa.error().m_field, "transitions[1]");
}

TEST(DfaModel, UndeclaredStartAndAccepting)
{
    auto bad_start = parser::to_dfa(dfa_record("q0,0,q1", "q7"));
    ASSERT_FALSE(bad_start.has_value());
    EXPECT_EQ(bad_start.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(bad_start.error().m_field, "start");

    auto bad_accepting = parser::to_dfa(dfa_record("q0,0,q1", "q0", "q2, q8"));
    ASSERT_FALSE(bad_accepting.has_value());
    EXPECT_EQ(bad_accepting.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(bad_accepting.error().m_field, "accepting");
}

TEST(DfaModel, RejectsEpsilonTransitions)
{
    auto dfa = parser::to_dfa(dfa_record("q0,λ,q1"));
    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::MalformedInput);
}

TEST(DfaModel, RejectsConflictingTargets)
{
    auto dfa = parser::to_dfa(dfa_record("q0,0,q1; q0,0,q2"));
    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::MalformedInput);
    EXPECT_EQ(dfa.error().m_field, "transitions[1]");

    // the same entry twice is not a conflict
    EXPECT_TRUE(parser::to_dfa(dfa_record("q0,0,q1; q0,0,q1")).has_value());
}

TEST(DfaModel, RejectsReservedEpsilonNames)
{
    auto dfa = parser::to_dfa(record(model::ModelKind::Dfa, {
        {"states", "q0, λ"}, {"alphabet", "a"}, {"transitions", ""},
        {"start", "q0"}, {"accepting", ""}}));
    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::MalformedInput);
    EXPECT_EQ(dfa.error().m_field, "states");
}

TEST(DfaModel, CreateValidatesDirectTables)
{
    model::Dfa::Transitions transitions{{{"a", "x"}, "b"}};
    EXPECT_TRUE(model::Dfa::create({"a", "b"}, {"x"}, transitions, "a", {"b"}).has_value());

    model::Dfa::Transitions dangling{{{"a", "x"}, "c"}};
    auto dfa = model::Dfa::create({"a", "b"}, {"x"}, dangling, "a", {"b"});
    ASSERT_FALSE(dfa.has_value());
    EXPECT_EQ(dfa.error().m_kind, ErrorKind::UndeclaredReference);
}

TEST(NfaModel, AccumulatesTargetsAndAllowsEmptyImages)
{
    auto nfa = make_nfa("q0, q1, q2", "0, 1", "q0,0,q0,q1; q0,0,q2; q0,1", "q0", "q2");

    EXPECT_EQ(nfa.image("q0", model::Symbol("0")), (model::StateSet{"q0", "q1", "q2"}));
    EXPECT_TRUE(nfa.image("q0", model::Symbol("1")).empty());
    EXPECT_TRUE(nfa.image("q2", model::Symbol("0")).empty());
}

TEST(NfaModel, RejectsEpsilonButEpsilonNfaAcceptsIt)
{
    std::map<std::string, std::string> fields{
        {"states", "q0, q1"}, {"alphabet", "a"}, {"transitions", "q0,λ,q1"},
        {"start", "q0"}, {"accepting", "q1"}};

    auto nfa = parser::to_nfa(record(model::ModelKind::Nfa, fields));
    ASSERT_FALSE(nfa.has_value());
    EXPECT_EQ(nfa.error().m_kind, ErrorKind::MalformedInput);

    auto enfa = parser::to_epsilon_nfa(record(model::ModelKind::EpsilonNfa, fields));
    ASSERT_TRUE(enfa.has_value());
    EXPECT_EQ(enfa->image("q0", model::Symbol::epsilon()), (model::StateSet{"q1"}));
}

TEST(NfaModel, EpsilonAliasIsAccepted)
{
    auto enfa = make_epsilon_nfa("q0, q1", "a", "q0,ε,q1", "q0", "q1");
    EXPECT_EQ(enfa.image("q0", model::Symbol::epsilon()), (model::StateSet{"q1"}));
}

TEST(UndeclaredReference, ReportedByEveryModelKind)
{
    auto nfa = parser::to_nfa(record(model::ModelKind::Nfa, {
        {"states", "q0, q1"}, {"alphabet", "a"}, {"transitions", "q0,a,q1,q9"},
        {"start", "q0"}, {"accepting", "q1"}}));
    ASSERT_FALSE(nfa.has_value());
    EXPECT_EQ(nfa.error().m_kind, ErrorKind::UndeclaredReference);

    auto enfa = parser::to_epsilon_nfa(record(model::ModelKind::EpsilonNfa, {
        {"states", "q0, q1"}, {"alphabet", "a"}, {"transitions", "q0,λ,q9"},
        {"start", "q0"}, {"accepting", "q1"}}));
    ASSERT_FALSE(enfa.has_value());
    EXPECT_EQ(enfa.error().m_kind, ErrorKind::UndeclaredReference);

    auto grammar = parser::to_grammar(record(model::ModelKind::Grammar, {
        {"variables", "S"}, {"terminals", "a"}, {"productions", "S,a q9"}, {"start", "S"}}));
    ASSERT_FALSE(grammar.has_value());
    EXPECT_EQ(grammar.error().m_kind, ErrorKind::UndeclaredReference);

    auto pda = parser::to_pda(record(model::ModelKind::Pda, {
        {"states", "p, q"}, {"input_alphabet", "a"}, {"stack_alphabet", "Z"},
        {"transitions", "p,a,Z,q9,Z"}, {"start", "p"}, {"initial_stack", "Z"}, {"accepting", "q"}}));
    ASSERT_FALSE(pda.has_value());
    EXPECT_EQ(pda.error().m_kind, ErrorKind::UndeclaredReference);
}

TEST(GrammarModel, ParsesBodiesAndKeepsEntryOrder)
{
    auto grammar = make_grammar("S, A", "a, b", "S,aS,b A,λ; A,a; S,aS", "S");

    const auto &bodies = grammar.productions_of("S");
    ASSERT_EQ(bodies.size(), 3u);
    EXPECT_EQ(bodies[0], model::ProductionBody("a", "S"));
    EXPECT_EQ(bodies[1], model::ProductionBody("b", "A"));
    EXPECT_TRUE(bodies[2].is_epsilon());
    EXPECT_EQ(grammar.productions_of("A"), (std::vector<model::ProductionBody>{model::ProductionBody("a")}));
}

TEST(GrammarModel, ParseBodyPrefersLongestTerminal)
{
    std::vector<std::string> variables{"S", "bS"};
    std::vector<std::string> terminals{"a", "ab"};

    auto body = model::parse_body("abS", variables, terminals, "test");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, model::ProductionBody("ab", "S"));
}

TEST(GrammarModel, RejectsNonRightLinearBodies)
{
    std::vector<std::string> variables{"S", "A"};
    std::vector<std::string> terminals{"a", "b"};

    auto starts_with_variable = model::parse_body("Sa", variables, terminals, "productions[0]");
    ASSERT_FALSE(starts_with_variable.has_value());
    EXPECT_EQ(starts_with_variable.error().m_kind, ErrorKind::MalformedInput);

    auto two_variables = model::parse_body("a S A", variables, terminals, "productions[0]");
    ASSERT_FALSE(two_variables.has_value());
    EXPECT_EQ(two_variables.error().m_kind, ErrorKind::MalformedInput);

    auto two_terminals = model::parse_body("a b", variables, terminals, "productions[0]");
    ASSERT_FALSE(two_terminals.has_value());
    EXPECT_EQ(two_terminals.error().m_kind, ErrorKind::MalformedInput);

    auto unknown = model::parse_body("cS", variables, terminals, "productions[0]");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().m_kind, ErrorKind::UndeclaredReference);
}

TEST(GrammarModel, UndeclaredVariableOnLeftHandSide)
{
    auto grammar = parser::to_grammar(record(model::ModelKind::Grammar, {
        {"variables", "S"}, {"terminals", "a"}, {"productions", "S,a; T,a"}, {"start", "S"}}));
    ASSERT_FALSE(grammar.has_value());
    EXPECT_EQ(grammar.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(grammar.error().m_field, "productions[1]");
}

TEST(GrammarModel, CreateRejectsUnitProductions)
{
    model::RegularGrammar::Productions productions;
    model::ProductionBody unit;
    unit.m_variable = "S";
    productions["S"].push_back(unit);

    auto grammar = model::RegularGrammar::create({"S"}, {"a"}, productions, "S");
    ASSERT_FALSE(grammar.has_value());
    EXPECT_EQ(grammar.error().m_kind, ErrorKind::MalformedInput);
}

TEST(PushdownAutomatonModel, BuildsStructure)
{
    auto pda = unwrap(parser::to_pda(record(model::ModelKind::Pda, {
        {"states", "p, q"}, {"input_alphabet", "a, b"}, {"stack_alphabet", "Z, A"},
        {"transitions", "p,a,Z,p,AZ; p,a,A,p,A A; p,b,A,q,λ; q,λ,Z,q,Z"},
        {"start", "p"}, {"initial_stack", "Z"}, {"accepting", "q"}})));

    EXPECT_EQ(pda.initial_stack(), "Z");
    EXPECT_TRUE(pda.is_accepting("q"));

    const auto &transitions = pda.transitions();
    auto push_az = transitions.at({"p", model::Symbol("a"), "Z"});
    EXPECT_EQ(push_az, (std::set<model::PDAMove>{model::PDAMove("p", {"A", "Z"})}));

    auto pop = transitions.at({"p", model::Symbol("b"), "A"});
    ASSERT_EQ(pop.size(), 1u);
    EXPECT_TRUE(pop.begin()->m_push.empty());

    EXPECT_TRUE(transitions.contains({"q", model::Symbol::epsilon(), "Z"}));
}

TEST(PushdownAutomatonModel, InitialStackMustBeDeclared)
{
    auto pda = parser::to_pda(record(model::ModelKind::Pda, {
        {"states", "p"}, {"input_alphabet", "a"}, {"stack_alphabet", "Z"},
        {"transitions", ""}, {"start", "p"}, {"initial_stack", "X"}, {"accepting", ""}}));
    ASSERT_FALSE(pda.has_value());
    EXPECT_EQ(pda.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(pda.error().m_field, "initial_stack");
}

TEST(PushdownAutomatonModel, UndeclaredPushedSymbol)
{
    auto pda = parser::to_pda(record(model::ModelKind::Pda, {
        {"states", "p"}, {"input_alphabet", "a"}, {"stack_alphabet", "Z"},
        {"transitions", "p,a,Z,p,XZ"}, {"start", "p"}, {"initial_stack", "Z"}, {"accepting", ""}}));
    ASSERT_FALSE(pda.has_value());
    EXPECT_EQ(pda.error().m_kind, ErrorKind::UndeclaredReference);
    EXPECT_EQ(pda.error().m_field, "transitions[0]");
}
