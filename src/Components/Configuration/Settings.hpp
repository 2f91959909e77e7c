//----------------------------------------------------------------------------------------------------------------------
// File: Settings.hpp
// Description: The validated option groups handed to the coordinator.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

struct Settings;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

struct Configuration::Settings
{
    Options::Heartbeat heartbeat;
    Options::Detection detection;
    Options::Balancing balancing;
    Options::Migration migration;
    Options::Market market;
};

//----------------------------------------------------------------------------------------------------------------------
