#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <lo/lo.h>

#include "core/Session.hpp"
#include "core/Logger.hpp"

namespace net {

/**
 * Forwards the resolution stream to the scoring / rendering side over OSC.
 *
 *   /maitrainer/resolution  i noteId, s grade, f deltaMs (0 for sweep misses)
 *   /maitrainer/score       i score, i combo, i maxCombo
 */
class OscSender {
public:
    OscSender(std::shared_ptr<core::OscQueue> inputQueue, const std::string& host, const std::string& port);
    ~OscSender();

    bool start();
    void stop();

    [[nodiscard]] uint64_t messagesSent() const { return _messagesSent; }

private:
    void loop();
    void send(const core::ScoreUpdate& update);

    std::shared_ptr<core::OscQueue> _inputQueue;
    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;

    std::atomic<bool> _running;
    std::atomic<uint64_t> _messagesSent{0};
    std::thread _thread;
};

} // namespace net
