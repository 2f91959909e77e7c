//----------------------------------------------------------------------------------------------------------------------
// File: NodeIdentifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "NodeIdentifier.hpp"
#include "Utilities/CryptoUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/container_hash/hash.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
//----------------------------------------------------------------------------------------------------------------------

std::optional<Node::Identifier> Node::GenerateIdentifier(std::string_view address)
{
    IdentifierBytes bytes{ 0 };
    if (!CryptoUtils::FillRandom(bytes)) { return {}; }
    return Identifier{ bytes, address };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Node::Identifier> Node::ToIdentifier(std::string_view hex, std::string_view address)
{
    auto const optBuffer = CryptoUtils::FromHex(hex);
    if (!optBuffer || optBuffer->size() != std::tuple_size_v<IdentifierBytes>) { return {}; }

    IdentifierBytes bytes{ 0 };
    std::copy(optBuffer->begin(), optBuffer->end(), bytes.begin());
    return Identifier{ bytes, address };
}

//----------------------------------------------------------------------------------------------------------------------

std::ostream& Node::operator<<(std::ostream& stream, Identifier const& identifier)
{
    stream << identifier.ToString();
    return stream;
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier::Identifier()
    : m_bytes{ 0 }
    , m_address(DefaultAddress)
    , m_publicKey()
    , m_trust(DefaultTrustScore)
{
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier::Identifier(
    IdentifierBytes const& bytes, std::string_view address, std::vector<std::uint8_t> const& publicKey, double trust)
    : m_bytes(bytes)
    , m_address(address)
    , m_publicKey(publicKey)
    , m_trust(std::clamp(trust, 0.0, 1.0))
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Identifier::operator==(Identifier const& other) const { return m_bytes == other.m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

bool Node::Identifier::operator!=(Identifier const& other) const { return m_bytes != other.m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

bool Node::Identifier::operator<(Identifier const& other) const { return m_bytes < other.m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

Node::IdentifierBytes const& Node::Identifier::GetBytes() const { return m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Node::Identifier::GetAddress() const { return m_address; }

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::uint8_t> const& Node::Identifier::GetPublicKey() const { return m_publicKey; }

//----------------------------------------------------------------------------------------------------------------------

double Node::Identifier::GetTrustScore() const { return m_trust; }

//----------------------------------------------------------------------------------------------------------------------

void Node::Identifier::SetTrustScore(double trust) { m_trust = std::clamp(trust, 0.0, 1.0); }

//----------------------------------------------------------------------------------------------------------------------

std::string Node::Identifier::ToString() const { return CryptoUtils::ToHex(m_bytes); }

//----------------------------------------------------------------------------------------------------------------------

std::string Node::Identifier::ToShortString() const
{
    return CryptoUtils::ToHex({ m_bytes.data(), ShortBytes });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Node::Hasher::operator()(Identifier const& identifier) const
{
    auto const& bytes = identifier.GetBytes();
    return boost::hash_range(bytes.begin(), bytes.end());
}

//----------------------------------------------------------------------------------------------------------------------
