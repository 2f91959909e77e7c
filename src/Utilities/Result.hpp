//----------------------------------------------------------------------------------------------------------------------
// File: Result.hpp
// Description: The result type returned by the coordinator's operation style calls. A result carries a code and a
// human readable reason that can be surfaced directly to the caller (e.g. "no eligible node").
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Mesh {
//----------------------------------------------------------------------------------------------------------------------

enum class ErrorCode : std::uint32_t
{
    Success,
    AllocationFailed,
    AssetNotFound,
    NetworkError,
    NotFound,
    InvalidArgument,
    InvalidState,
    Conflict,
    MigrationInProgress
};

class Result;

template<typename ValueType>
using Expected = std::variant<ValueType, Result>;

[[nodiscard]] std::string_view GetDescription(ErrorCode code) noexcept;

//----------------------------------------------------------------------------------------------------------------------
} // Mesh namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Mesh::Result {
//----------------------------------------------------------------------------------------------------------------------

class Mesh::Result : public std::exception
{
public:
    Result() noexcept;
    Result(ErrorCode code) noexcept;
    Result(ErrorCode code, std::string message);

    ~Result() = default;
    Result(Result const& other) = default;
    Result(Result&& other) = default;
    Result& operator=(Result const& other) = default;
    Result& operator=(Result&& other) = default;

    [[nodiscard]] bool operator==(Result const& other) const noexcept;
    [[nodiscard]] bool operator==(ErrorCode other) const noexcept;

    [[nodiscard]] explicit operator bool() const noexcept;

    [[nodiscard]] virtual char const* what() const noexcept override;
    [[nodiscard]] bool IsSuccess() const noexcept;
    [[nodiscard]] bool IsError() const noexcept;
    [[nodiscard]] ErrorCode GetCode() const noexcept;
    [[nodiscard]] std::string const& GetMessage() const noexcept;

private:
    ErrorCode m_code;
    std::string m_message;
};

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Mesh::GetDescription(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::AllocationFailed: return "Allocation failed";
        case ErrorCode::AssetNotFound: return "Asset not found";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::MigrationInProgress: return "Migration in progress";
    }
    return "Unknown error";
}

//----------------------------------------------------------------------------------------------------------------------

inline Mesh::Result::Result() noexcept
    : std::exception()
    , m_code(ErrorCode::Success)
    , m_message()
{
}

//----------------------------------------------------------------------------------------------------------------------

inline Mesh::Result::Result(ErrorCode code) noexcept
    : std::exception()
    , m_code(code)
    , m_message()
{
}

//----------------------------------------------------------------------------------------------------------------------

inline Mesh::Result::Result(ErrorCode code, std::string message)
    : std::exception()
    , m_code(code)
    , m_message(std::move(message))
{
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Mesh::Result::operator==(Result const& other) const noexcept { return m_code == other.m_code; }

//----------------------------------------------------------------------------------------------------------------------

inline bool Mesh::Result::operator==(ErrorCode other) const noexcept { return m_code == other; }

//----------------------------------------------------------------------------------------------------------------------

inline Mesh::Result::operator bool() const noexcept { return IsSuccess(); }

//----------------------------------------------------------------------------------------------------------------------

inline char const* Mesh::Result::what() const noexcept
{
    // Prefer the contextual reason, otherwise fall back to the generic description of the code.
    return (!m_message.empty()) ? m_message.c_str() : GetDescription(m_code).data();
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Mesh::Result::IsSuccess() const noexcept { return m_code == ErrorCode::Success; }

//----------------------------------------------------------------------------------------------------------------------

inline bool Mesh::Result::IsError() const noexcept { return m_code != ErrorCode::Success; }

//----------------------------------------------------------------------------------------------------------------------

inline Mesh::ErrorCode Mesh::Result::GetCode() const noexcept { return m_code; }

//----------------------------------------------------------------------------------------------------------------------

inline std::string const& Mesh::Result::GetMessage() const noexcept { return m_message; }

//----------------------------------------------------------------------------------------------------------------------
// } Mesh::Result
//----------------------------------------------------------------------------------------------------------------------
