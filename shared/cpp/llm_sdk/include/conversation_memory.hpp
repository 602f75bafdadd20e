#pragma once
#include <string>
#include <vector>

enum class Speaker { Human, Assistant };

struct Turn {
    Speaker speaker;
    std::string text;
};

// Ordered (speaker, utterance) log owned by exactly one session.
// Turns are only ever appended; the log is cleared as a whole.
class ConversationMemory {
public:
    void append(Speaker speaker, std::string text);
    void append_exchange(std::string question, std::string answer);
    void clear();

    const std::vector<Turn>& turns() const { return turns_; }
    bool empty() const { return turns_.empty(); }
    size_t size() const { return turns_.size(); }

    // "Human: ...\nAI: ..." transcript, one turn per line.
    std::string transcript() const;

private:
    std::vector<Turn> turns_;
};

const char* speaker_label(Speaker s);
