#include "net/OscSender.hpp"
#include <chrono>

namespace net {

OscSender::OscSender(std::shared_ptr<core::OscQueue> inputQueue, const std::string& host, const std::string& port)
    : _inputQueue(std::move(inputQueue)), _host(host), _port(port), _running(false) {
}

OscSender::~OscSender() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscSender::start() {
    if (_running) return true;

    // Initialize liblo address
    if (!_loAddress) {
        _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    }
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    _running = true;
    _thread = std::thread(&OscSender::loop, this);
    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }

    // Flush what the frame loop already queued
    core::ScoreUpdate update;
    while (_inputQueue->pop_front(update)) {
        send(update);
    }
    core::Logger::info("OscSender stopped. Messages sent: ", _messagesSent.load());
}

void OscSender::loop() {
    while (_running) {
        core::ScoreUpdate update;
        if (_inputQueue->pop_front(update)) {
            send(update);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void OscSender::send(const core::ScoreUpdate& update) {
    if (!_loAddress) return;

    const auto& resolution = update.resolution;

    lo_message resMsg = lo_message_new();
    lo_message_add_int32(resMsg, static_cast<int32_t>(resolution.noteId));
    lo_message_add_string(resMsg, core::gradeName(resolution.grade));
    lo_message_add_float(resMsg, static_cast<float>(resolution.deltaMs.value_or(0.0)));
    int ret = lo_send_message(_loAddress, "/maitrainer/resolution", resMsg);
    lo_message_free(resMsg);
    if (ret == -1) {
        core::Logger::error("OscSender: Failed to send resolution: ", lo_address_errstr(_loAddress));
        return;
    }

    lo_message scoreMsg = lo_message_new();
    lo_message_add_int32(scoreMsg, update.score);
    lo_message_add_int32(scoreMsg, update.combo);
    lo_message_add_int32(scoreMsg, update.maxCombo);
    ret = lo_send_message(_loAddress, "/maitrainer/score", scoreMsg);
    lo_message_free(scoreMsg);
    if (ret == -1) {
        core::Logger::error("OscSender: Failed to send score: ", lo_address_errstr(_loAddress));
        return;
    }

    _messagesSent += 2;
}

} // namespace net
