#include "voice_channel.hpp"

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <thread>

namespace spex {

ConsoleVoice::ConsoleVoice(const std::string& tts_command) : tts_command_(tts_command) {}

void ConsoleVoice::speak(const std::string& text) {
    if (text.empty()) return;
    std::lock_guard<std::mutex> lock(out_mu_);
    std::cout << "Assistant: " << text << std::endl;
    if (tts_command_.empty()) return;

    FILE* pipe = ::popen(tts_command_.c_str(), "w");
    if (!pipe) {
        std::cerr << "[WARN] Unable to start TTS command: " << tts_command_ << std::endl;
        return;
    }
    std::fputs(text.c_str(), pipe);
    std::fputc('\n', pipe);
    int rc = ::pclose(pipe);
    if (rc != 0) {
        std::cerr << "[WARN] TTS command exited with status " << rc << std::endl;
    }
}

std::string ConsoleVoice::listen(double timeout_sec, double phrase_limit_sec) {
    // Console lines arrive complete, so the phrase limit never cuts one short.
    (void)phrase_limit_sec;
    if (input_closed_) {
        std::this_thread::sleep_for(std::chrono::duration<double>(timeout_sec));
        return "";
    }

    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout_sec * 1000.0));
    if (rc <= 0) return "";

    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cerr << "[WARN] Voice input closed" << std::endl;
        input_closed_ = true;
        return "";
    }
    if (!line.empty()) std::cout << "You said: " << line << std::endl;
    return line;
}

}  // namespace spex
