#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <chrono>
#include <memory>
#include <variant>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/xpc/XPCError.hpp"
#include "SecurityOperationRecorder.hpp"
#include "SecurityScopedAccess.hpp"

namespace Rbum {

/**
 * @brief Bookmark and access strategy shared by the client and the helper
 *
 * Every call is recorded through the SecurityOperationRecorder handed to
 * the constructor.
 */
class SecurityService {
public:
    explicit SecurityService(std::shared_ptr<SecurityOperationRecorder> recorder);
    virtual ~SecurityService() = default;

    SecurityService(const SecurityService&) = delete;
    SecurityService& operator=(const SecurityService&) = delete;

    virtual QString name() const = 0;

    virtual Expected<QByteArray, XPCError> createBookmark(const QString& path, bool isDirectory);
    virtual Expected<SecurityScopedAccess, XPCError> resolveBookmark(const QByteArray& bookmarkData);
    virtual Expected<void, XPCError> startAccessing(SecurityScopedAccess& access);
    virtual void stopAccessing(SecurityScopedAccess& access);

    const std::shared_ptr<SecurityOperationRecorder>& recorder() const { return recorder_; }

protected:
    void recordSuccess(const QString& path, SecurityOperationType type);
    void recordFailure(const QString& path, SecurityOperationType type, XPCError error);

private:
    std::shared_ptr<SecurityOperationRecorder> recorder_;
};

class ProductionSecurityService : public SecurityService {
public:
    using SecurityService::SecurityService;

    QString name() const override { return "production"; }
};

struct DevelopmentOptions {
    bool simulateBookmarkFailures = false;
    bool simulateAccessFailures = false;
    bool simulatePermissionFailures = false;
    std::chrono::milliseconds artificialDelay{0};
};

// Real file-system behaviour with optional injected failures and latency
class DevelopmentSecurityService : public SecurityService {
public:
    DevelopmentSecurityService(std::shared_ptr<SecurityOperationRecorder> recorder,
                               const DevelopmentOptions& options);

    QString name() const override { return "development"; }

    Expected<QByteArray, XPCError> createBookmark(const QString& path, bool isDirectory) override;
    Expected<SecurityScopedAccess, XPCError> resolveBookmark(const QByteArray& bookmarkData) override;
    Expected<void, XPCError> startAccessing(SecurityScopedAccess& access) override;

    const DevelopmentOptions& options() const { return options_; }

private:
    void simulateDelay() const;

    DevelopmentOptions options_;
};

struct ProductionSecurity {};
struct DevelopmentSecurity {
    DevelopmentOptions options;
};

using SecurityMode = std::variant<ProductionSecurity, DevelopmentSecurity>;

SecurityMode securityModeFromSettings(const Config::SecuritySettings& settings);

std::shared_ptr<SecurityService> createSecurityService(const SecurityMode& mode,
                                                       std::shared_ptr<SecurityOperationRecorder> recorder);

} // namespace Rbum
