#ifndef PAW_CONSOLE_H
#define PAW_CONSOLE_H

#include <string>
#include <vector>
#include <mutex>
#include <iostream>

namespace paw {

// Receives every (text, title) result the dispatcher produces
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void display(const std::string& text, const std::string& title) = 0;
};

class ConfirmationPrompt {
public:
    virtual ~ConfirmationPrompt() = default;
    virtual bool confirm(const std::string& question) = 0;
};

// Suggests what to type for free-form input; empty when it has nothing
class KeywordAdvisor {
public:
    virtual ~KeywordAdvisor() = default;
    virtual std::string advise(const std::string& text, const std::string& previous_output) = 0;
};

class ConsoleOutput : public OutputSink {
public:
    explicit ConsoleOutput(std::ostream& out = std::cout);

    void display(const std::string& text, const std::string& title) override;
    // Streams one line of a running tool's output
    void line(const std::string& text);

private:
    std::ostream& out_;
    std::mutex mutex_;
};

class ConsolePrompt : public ConfirmationPrompt {
public:
    ConsolePrompt(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool confirm(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

struct KeywordAdvice {
    std::vector<std::string> keywords;
    std::string advice;
};

class StaticKeywordAdvisor : public KeywordAdvisor {
public:
    StaticKeywordAdvisor();

    std::string advise(const std::string& text, const std::string& previous_output) override;

private:
    std::vector<KeywordAdvice> table_;
};

} // namespace paw

#endif // PAW_CONSOLE_H
