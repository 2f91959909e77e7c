//----------------------------------------------------------------------------------------------------------------------
// File: AssetTypes.hpp
// Description: Identification and classification of the resource allocations placed on nodes in the mesh.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Asset {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint8_t { Cpu, Gpu, Memory, Storage, Network, Container };

// The state of an allocation as reported by an observing node.
enum class Status : std::uint8_t { Pending, Allocated, Active, Migrating, Suspended, Released, Failed };

using IdentifierBytes = std::array<std::uint8_t, 32>;

class Identifier;

struct Hasher;

[[nodiscard]] std::optional<Identifier> GenerateIdentifier(Type type);

[[nodiscard]] std::string_view ToString(Type type);
[[nodiscard]] std::string_view ToString(Status status);

//----------------------------------------------------------------------------------------------------------------------
} // Asset namespace
//----------------------------------------------------------------------------------------------------------------------

class Asset::Identifier
{
public:
    Identifier();
    Identifier(IdentifierBytes const& bytes, Type type);

    [[nodiscard]] bool operator==(Identifier const& other) const;
    [[nodiscard]] bool operator!=(Identifier const& other) const;
    [[nodiscard]] bool operator<(Identifier const& other) const;

    [[nodiscard]] IdentifierBytes const& GetBytes() const;
    [[nodiscard]] Type GetType() const;
    [[nodiscard]] std::string ToString() const;

private:
    IdentifierBytes m_bytes;
    Type m_type;
};

//----------------------------------------------------------------------------------------------------------------------

struct Asset::Hasher
{
    std::size_t operator()(Identifier const& identifier) const;
};

//----------------------------------------------------------------------------------------------------------------------

template <>
struct fmt::formatter<Asset::Identifier>
{
    constexpr auto parse(format_parse_context& ctx)
    {
        auto const begin = ctx.begin();
        if (begin != ctx.end() && *begin != '}') { throw format_error("invalid format"); }
        return begin;
    }

    template <typename FormatContext>
    auto format(Asset::Identifier const& identifier, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", identifier.ToString().substr(0, 16));
    }
};

//----------------------------------------------------------------------------------------------------------------------
