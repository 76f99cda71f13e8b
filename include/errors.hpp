#ifndef ERRORS_H
#define ERRORS_H

#include <string>
#include <string_view>

#include <tl/expected.hpp>

enum class ErrorKind
{
    MalformedInput,
    UndeclaredReference,
    NonDeterministicGrammar,
    UndefinedTransition,
    MissingField,
    UnknownModelKind,
    UnsupportedOperation,
    EmptyPath,
    InvalidRecordFile,
    OutputFileError
};

struct Error
{
    Error() = default;
    Error(
        ErrorKind kind,
        std::string_view field,
        std::string_view detail
    )
        : m_kind{kind},
          m_field{field},
          m_detail{detail} {}

    auto operator==(const Error &) const -> bool = default;

    ErrorKind m_kind{ErrorKind::MalformedInput};
    // where it happened, e.g. "transitions[2]"
    std::string m_field;
    std::string m_detail;
};

template <typename T>
using Expected = tl::expected<T, Error>;

[[nodiscard]]
inline auto make_error(ErrorKind kind, std::string_view field, std::string_view detail) -> tl::unexpected<Error>
{
    return tl::unexpected<Error>(Error(kind, field, detail));
}

[[nodiscard]]
auto to_string(ErrorKind kind) -> std::string_view;

[[nodiscard]]
auto describe(const Error &err) -> std::string;

// turns an error into a runtime_error at the application boundary
[[noreturn]]
void HandleError(const Error &err);

#endif
