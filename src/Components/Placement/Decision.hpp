//----------------------------------------------------------------------------------------------------------------------
// File: Decision.hpp
// Description: The outcome of placing an allocation and the consensus verdict that authorized it. The attestations are
// retained for auditing only, the proof itself is never inspected here.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Placement {
//----------------------------------------------------------------------------------------------------------------------

using Signature = std::vector<std::uint8_t>;

struct Attestation;
struct ConsensusVerdict;
struct Candidate;
struct Decision;

//----------------------------------------------------------------------------------------------------------------------
} // Placement namespace
//----------------------------------------------------------------------------------------------------------------------

struct Placement::Attestation
{
    Node::Identifier node;
    Signature signature;
};

//----------------------------------------------------------------------------------------------------------------------

struct Placement::ConsensusVerdict
{
    bool approved = false;
    std::vector<Attestation> attestations;
};

//----------------------------------------------------------------------------------------------------------------------

struct Placement::Candidate
{
    Node::Identifier node;
    double score = 0.0;
};

//----------------------------------------------------------------------------------------------------------------------

struct Placement::Decision
{
    Asset::Identifier asset;
    Node::Identifier target;
    double score = 0.0;
    TimeUtils::Timepoint decided;
    std::vector<Node::Identifier> participants;
    std::vector<Signature> signatures;
};

//----------------------------------------------------------------------------------------------------------------------
