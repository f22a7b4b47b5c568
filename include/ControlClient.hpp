#pragma once
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "Parser.hpp"
#include "Types.hpp"

class TelemetryClient;
class ControlBus;

// Simulation control requests. A successful simulate-by-number also drives
// the view through the control bus.
class ControlClient
{
private:
    TelemetryClient& client;
    ControlBus& bus;

public:
    ControlClient(TelemetryClient& http, ControlBus& controls);

    boost::asio::awaitable<ControlResult> reset();
    boost::asio::awaitable<ReseedResult> reseed();
    boost::asio::awaitable<ControlResult> injectDelay(std::string trainId, int minutes);
    boost::asio::awaitable<SimulationResult> simulateByTrainNumber(std::string trainNo);
    boost::asio::awaitable<std::vector<TrainSearchHit>> search(std::string query);

    static std::string delayBody(std::string const& trainId, int minutes);
    static void publishSimulation(ControlBus& bus, SimulationResult const& sim);
};
