#pragma once

#include <mutex>
#include <string>

namespace spex {

// Speech in/out collaborator. speak() blocks until the utterance finished;
// listen() blocks at most `timeout_sec` and returns "" on timeout or when
// nothing intelligible was heard.
class VoiceChannel {
public:
    virtual ~VoiceChannel() = default;

    virtual void speak(const std::string& text) = 0;
    virtual std::string listen(double timeout_sec, double phrase_limit_sec) = 0;
};

// Reads utterances as lines on stdin and prints what it says; when a TTS
// command is configured (e.g. "espeak-ng --stdin") the text is also piped to
// it and speak() waits for the process to exit.
class ConsoleVoice : public VoiceChannel {
public:
    explicit ConsoleVoice(const std::string& tts_command);

    void speak(const std::string& text) override;
    std::string listen(double timeout_sec, double phrase_limit_sec) override;

private:
    std::string tts_command_;
    std::mutex out_mu_;
    bool input_closed_{false};
};

}  // namespace spex
