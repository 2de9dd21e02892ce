#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/xpc/XPCError.hpp"
#include "core/xpc/XPCTypes.hpp"

namespace Rbum {

struct CommandPolicy {
    QStringList unsafeArguments = {"--no-cache", "--no-lock", "--force"};
    QStringList requiredEnvironment = {"RESTIC_PASSWORD", "RESTIC_REPOSITORY"};

    static CommandPolicy fromSettings(const Config::ResticSettings& settings);
};

/**
 * @brief Well-formedness rules for a restic command before it is issued
 *
 * Checks run in a fixed order and stop at the first violation:
 * command and working directory present, arguments free of traversal
 * sequences and deny-listed flags, required environment present and
 * non-empty, no empty environment entries, positive timeout.
 */
class CommandValidator {
public:
    explicit CommandValidator(CommandPolicy policy = CommandPolicy());

    Expected<void, XPCError> validate(const XPCCommandConfig& config) const;

    Expected<void, XPCError> validateArguments(const QStringList& arguments) const;
    Expected<void, XPCError> validateEnvironment(const QMap<QString, QString>& environment) const;

    const CommandPolicy& policy() const { return policy_; }

    static bool isPathTraversalAttempt(const QString& argument);
    static bool hasNullBytes(const QString& input);

private:
    CommandPolicy policy_;
};

} // namespace Rbum
