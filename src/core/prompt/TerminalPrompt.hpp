#pragma once

#include "IConfirmationPrompt.hpp"

namespace tas {

/// Reads the answer from stdin. On a terminal a single key press answers
/// (no Enter needed); otherwise one line is read. End of input declines.
class TerminalPrompt : public IConfirmationPrompt {
public:
    bool askConfirmation(const QString& prompt) override;

private:
    static QString readKey();
    static QString readLine();
};

} // namespace tas
