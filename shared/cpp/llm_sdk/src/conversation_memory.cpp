#include "../include/conversation_memory.hpp"

const char* speaker_label(Speaker s) {
    return s == Speaker::Human ? "Human" : "AI";
}

void ConversationMemory::append(Speaker speaker, std::string text) {
    turns_.push_back({speaker, std::move(text)});
}

void ConversationMemory::append_exchange(std::string question, std::string answer) {
    append(Speaker::Human, std::move(question));
    append(Speaker::Assistant, std::move(answer));
}

void ConversationMemory::clear() {
    turns_.clear();
}

std::string ConversationMemory::transcript() const {
    std::string out;
    for (auto& t : turns_) {
        out += speaker_label(t.speaker);
        out += ": ";
        out += t.text;
        out += '\n';
    }
    return out;
}
