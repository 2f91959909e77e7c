//----------------------------------------------------------------------------------------------------------------------
// File: NodeIdentifier.hpp
// Description: The identity of a node in the mesh. The 32 identifier bytes are the node's identity, the address, key,
// and trust score travel with it but never take part in comparisons or hashing.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

using IdentifierBytes = std::array<std::uint8_t, 32>;

class Identifier;

struct Hasher;

[[nodiscard]] std::optional<Identifier> GenerateIdentifier(std::string_view address = "::1");
[[nodiscard]] std::optional<Identifier> ToIdentifier(std::string_view hex, std::string_view address = "::1");

std::ostream& operator<<(std::ostream& stream, Identifier const& identifier);

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::Identifier
{
public:
    static constexpr double DefaultTrustScore = 1.0;
    static constexpr std::string_view DefaultAddress = "::1";
    static constexpr std::size_t ShortBytes = 8;

    Identifier();
    explicit Identifier(
        IdentifierBytes const& bytes,
        std::string_view address = DefaultAddress,
        std::vector<std::uint8_t> const& publicKey = {},
        double trust = DefaultTrustScore);

    Identifier(Identifier const&) = default;
    Identifier(Identifier&&) = default;
    Identifier& operator=(Identifier const&) = default;
    Identifier& operator=(Identifier&&) = default;

    [[nodiscard]] bool operator==(Identifier const& other) const;
    [[nodiscard]] bool operator!=(Identifier const& other) const;
    [[nodiscard]] bool operator<(Identifier const& other) const;

    [[nodiscard]] IdentifierBytes const& GetBytes() const;
    [[nodiscard]] std::string const& GetAddress() const;
    [[nodiscard]] std::vector<std::uint8_t> const& GetPublicKey() const;
    [[nodiscard]] double GetTrustScore() const;

    // Trust is clamped into [0, 1].
    void SetTrustScore(double trust);

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToShortString() const;

private:
    IdentifierBytes m_bytes;
    std::string m_address;
    std::vector<std::uint8_t> m_publicKey;
    double m_trust;
};

//----------------------------------------------------------------------------------------------------------------------

struct Node::Hasher
{
    std::size_t operator()(Identifier const& identifier) const;
};

//----------------------------------------------------------------------------------------------------------------------

template <>
struct fmt::formatter<Node::Identifier>
{
    constexpr auto parse(format_parse_context& ctx)
    {
        auto const begin = ctx.begin();
        if (begin != ctx.end() && *begin != '}') { throw format_error("invalid format"); }
        return begin;
    }

    template <typename FormatContext>
    auto format(Node::Identifier const& identifier, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", identifier.ToShortString());
    }
};

//----------------------------------------------------------------------------------------------------------------------
