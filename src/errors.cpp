#include "../include/errors.hpp"

#include <stdexcept>

#include <fmt/format.h>

auto to_string(ErrorKind kind) -> std::string_view
{
    switch (kind)
    {
    case ErrorKind::MalformedInput:
        return "MALFORMED INPUT";
    case ErrorKind::UndeclaredReference:
        return "UNDECLARED REFERENCE";
    case ErrorKind::NonDeterministicGrammar:
        return "NON-DETERMINISTIC GRAMMAR";
    case ErrorKind::UndefinedTransition:
        return "UNDEFINED TRANSITION";
    case ErrorKind::MissingField:
        return "MISSING FIELD";
    case ErrorKind::UnknownModelKind:
        return "UNKNOWN MODEL KIND";
    case ErrorKind::UnsupportedOperation:
        return "UNSUPPORTED OPERATION";
    case ErrorKind::EmptyPath:
        return "EMPTY PATH";
    case ErrorKind::InvalidRecordFile:
        return "INVALID RECORD FILE";
    case ErrorKind::OutputFileError:
        return "OUTPUT FILE ERROR";
    }
    return "UNKNOWN ERROR";
}

auto describe(const Error &err) -> std::string
{
    if (err.m_field.empty())
    {
        return fmt::format("<{}> : {}", to_string(err.m_kind), err.m_detail);
    }
    return fmt::format("<{}> {} : {}", to_string(err.m_kind), err.m_field, err.m_detail);
}

void HandleError(const Error &err)
{
    switch (err.m_kind)
    {
    case ErrorKind::EmptyPath:
    case ErrorKind::InvalidRecordFile:
        throw std::runtime_error(
            describe(err) + " - are you sure the record is an <automaton> XML document?");
    case ErrorKind::NonDeterministicGrammar:
        throw std::runtime_error(
            describe(err) + " - only deterministic right-linear grammars convert directly to a DFA");
    default:
        throw std::runtime_error(describe(err));
    }
}
