#include "CommandValidator.hpp"
#include "core/common/Logger.hpp"

namespace Rbum {

CommandPolicy CommandPolicy::fromSettings(const Config::ResticSettings& settings) {
    CommandPolicy policy;
    policy.unsafeArguments = settings.unsafeArguments;
    policy.requiredEnvironment = settings.requiredEnvironment;
    return policy;
}

CommandValidator::CommandValidator(CommandPolicy policy)
    : policy_(std::move(policy)) {
}

Expected<void, XPCError> CommandValidator::validate(const XPCCommandConfig& config) const {
    if (config.command.trimmed().isEmpty()) {
        RBUM_WARN("Command validation failed: empty command");
        return makeUnexpected(XPCError::InvalidCommand);
    }

    if (config.workingDirectory.trimmed().isEmpty()) {
        RBUM_WARN("Command validation failed: empty working directory for '{}'",
                  config.command.toStdString());
        return makeUnexpected(XPCError::InvalidCommand);
    }

    if (hasNullBytes(config.command) || hasNullBytes(config.workingDirectory)) {
        RBUM_WARN("Command validation failed: null byte in command or working directory");
        return makeUnexpected(XPCError::InvalidCommand);
    }

    auto arguments = validateArguments(config.arguments);
    if (arguments.hasError()) {
        return arguments;
    }

    auto environment = validateEnvironment(config.environment);
    if (environment.hasError()) {
        return environment;
    }

    if (config.timeoutSeconds <= 0) {
        RBUM_WARN("Command validation failed: timeout must be positive (got {})", config.timeoutSeconds);
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    return Expected<void, XPCError>();
}

Expected<void, XPCError> CommandValidator::validateArguments(const QStringList& arguments) const {
    for (const QString& argument : arguments) {
        if (isPathTraversalAttempt(argument) || hasNullBytes(argument)) {
            RBUM_WARN("Unsafe argument rejected: {}", argument.toStdString());
            return makeUnexpected(XPCError::UnsafeArguments);
        }

        if (policy_.unsafeArguments.contains(argument)) {
            RBUM_WARN("Deny-listed argument rejected: {}", argument.toStdString());
            return makeUnexpected(XPCError::UnsafeArguments);
        }
    }
    return Expected<void, XPCError>();
}

Expected<void, XPCError> CommandValidator::validateEnvironment(const QMap<QString, QString>& environment) const {
    for (const QString& key : policy_.requiredEnvironment) {
        if (environment.value(key).isEmpty()) {
            RBUM_WARN("Missing required environment variable: {}", key.toStdString());
            return makeUnexpected(XPCError::MissingEnvironment);
        }
    }

    for (auto it = environment.constBegin(); it != environment.constEnd(); ++it) {
        if (it.key().trimmed().isEmpty()) {
            RBUM_WARN("Environment contains an empty key");
            return makeUnexpected(XPCError::InvalidCommand);
        }
        // Values are never logged, they may carry the repository password
        if (it.value().isEmpty()) {
            RBUM_WARN("Environment variable {} has an empty value", it.key().toStdString());
            return makeUnexpected(XPCError::InvalidCommand);
        }
    }
    return Expected<void, XPCError>();
}

bool CommandValidator::isPathTraversalAttempt(const QString& argument) {
    return argument.contains("..");
}

bool CommandValidator::hasNullBytes(const QString& input) {
    return input.contains(QChar(0));
}

} // namespace Rbum
