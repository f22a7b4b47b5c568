#include <iostream>
#include <nlohmann/json.hpp>
#include "ConfigurationManager.hpp"
#include "ControlBus.hpp"
#include "ControlClient.hpp"
#include "TelemetryClient.hpp"

ControlClient::ControlClient(TelemetryClient& http, ControlBus& controls)
    : client(http)
    , bus(controls)
{
}

std::string ControlClient::delayBody(std::string const& trainId, int minutes)
{
    nlohmann::json body = {
        {"train_id", trainId},
        {"delay_min", minutes}
    };
    return body.dump();
}

void ControlClient::publishSimulation(ControlBus& bus, SimulationResult const& sim)
{
    if (!sim.result.success)
        return;

    bus.publish(SetPlayback{true});
    bus.publish(HighlightRoute{sim.route});
    bus.publish(LocateVehicle{sim.trainId});
}

boost::asio::awaitable<ControlResult> ControlClient::reset()
{
    std::string body = co_await client.post(ConfigurationManager::RESET_PATH);
    ControlResult result = Parser::parseControlResult(body);
    std::cout << "[Control] Reset: " << (result.success ? "ok" : result.error) << std::endl;
    co_return result;
}

boost::asio::awaitable<ReseedResult> ControlClient::reseed()
{
    std::string body = co_await client.post(ConfigurationManager::RESEED_PATH);
    ReseedResult reseed = Parser::parseReseedResult(body);
    if (reseed.result.success)
        std::cout << "[Control] Reseed: " << reseed.trainCount << " trains" << std::endl;
    else
        std::cout << "[Control] Reseed: " << reseed.result.error << std::endl;
    co_return reseed;
}

boost::asio::awaitable<ControlResult> ControlClient::injectDelay(std::string trainId, int minutes)
{
    std::string body = co_await client.post(ConfigurationManager::DELAY_PATH, delayBody(trainId, minutes));
    ControlResult result = Parser::parseControlResult(body);
    std::cout << "[Control] Delay " << trainId << " +" << minutes << "m: "
              << (result.success ? "ok" : result.error) << std::endl;
    co_return result;
}

boost::asio::awaitable<SimulationResult> ControlClient::simulateByTrainNumber(std::string trainNo)
{
    std::string target = ConfigurationManager::SIMULATE_PATH + "?train_no=" + TelemetryClient::encodeComponent(trainNo);
    std::string body = co_await client.post(target);

    SimulationResult sim = Parser::parseSimulationResult(body);
    if (sim.result.success)
    {
        std::cout << "[Control] Simulating train " << trainNo << " as " << sim.trainId
                  << " (" << sim.route.size() << " stops)" << std::endl;
    }
    else
    {
        std::cerr << "[Control] Simulate " << trainNo << " failed: " << sim.result.error << std::endl;
    }

    publishSimulation(bus, sim);
    co_return sim;
}

boost::asio::awaitable<std::vector<TrainSearchHit>> ControlClient::search(std::string query)
{
    std::string target = ConfigurationManager::SEARCH_PATH + "?q=" + TelemetryClient::encodeComponent(query);
    std::string body = co_await client.fetch(target);
    co_return Parser::parseSearchResults(body);
}
