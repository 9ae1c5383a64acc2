#pragma once

#include <QString>

namespace tas {

/// A blocking yes/no gate in front of an irreversible step.
class IConfirmationPrompt {
public:
    virtual ~IConfirmationPrompt() = default;

    /// Show prompt and return true only on an explicit yes.
    virtual bool askConfirmation(const QString& prompt) = 0;
};

/// True iff reply starts with 'y' or 'Y'.
inline bool isAffirmative(const QString& reply)
{
    return !reply.isEmpty() && (reply.at(0) == QLatin1Char('y') || reply.at(0) == QLatin1Char('Y'));
}

} // namespace tas
