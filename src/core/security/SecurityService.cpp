#include "SecurityService.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QThread>

namespace Rbum {

namespace {
template<typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

QString bookmarkPath(const QByteArray& bookmarkData) {
    auto decoded = SecurityScopedAccess::resolve(bookmarkData);
    return decoded.hasValue() ? decoded.value().path() : QString("<bookmark>");
}
}

SecurityService::SecurityService(std::shared_ptr<SecurityOperationRecorder> recorder)
    : recorder_(recorder ? std::move(recorder) : std::make_shared<SecurityOperationRecorder>()) {
}

void SecurityService::recordSuccess(const QString& path, SecurityOperationType type) {
    recorder_->recordOperation(path, type, SecurityOperationStatus::Success);
}

void SecurityService::recordFailure(const QString& path, SecurityOperationType type, XPCError error) {
    recorder_->recordOperation(path, type, SecurityOperationStatus::Failure, errorString(error));
}

Expected<QByteArray, XPCError> SecurityService::createBookmark(const QString& path, bool isDirectory) {
    auto access = SecurityScopedAccess::create(path, isDirectory);
    if (access.hasError()) {
        recordFailure(path, SecurityOperationType::Bookmark, access.error());
        return makeUnexpected(access.error());
    }

    recordSuccess(access.value().path(), SecurityOperationType::Bookmark);
    return access.value().bookmarkData();
}

Expected<SecurityScopedAccess, XPCError> SecurityService::resolveBookmark(const QByteArray& bookmarkData) {
    auto access = SecurityScopedAccess::resolve(bookmarkData);
    if (access.hasError()) {
        recordFailure("<bookmark>", SecurityOperationType::Bookmark, access.error());
        return makeUnexpected(access.error());
    }

    recordSuccess(access.value().path(), SecurityOperationType::Bookmark);
    return access;
}

Expected<void, XPCError> SecurityService::startAccessing(SecurityScopedAccess& access) {
    auto result = access.startAccessing();
    if (result.hasError()) {
        recordFailure(access.path(), SecurityOperationType::Access, result.error());
        return result;
    }

    recordSuccess(access.path(), SecurityOperationType::Access);
    return result;
}

void SecurityService::stopAccessing(SecurityScopedAccess& access) {
    if (!access.isAccessing()) {
        return;
    }
    access.stopAccessing();
    recordSuccess(access.path(), SecurityOperationType::Access);
}

DevelopmentSecurityService::DevelopmentSecurityService(std::shared_ptr<SecurityOperationRecorder> recorder,
                                                       const DevelopmentOptions& options)
    : SecurityService(std::move(recorder))
    , options_(options) {
    RBUM_WARN("Development security service active (bookmark failures: {}, access failures: {}, "
              "permission failures: {}, delay: {}ms)",
              options_.simulateBookmarkFailures, options_.simulateAccessFailures,
              options_.simulatePermissionFailures, options_.artificialDelay.count());
}

void DevelopmentSecurityService::simulateDelay() const {
    if (options_.artificialDelay.count() > 0) {
        QThread::msleep(static_cast<unsigned long>(options_.artificialDelay.count()));
    }
}

Expected<QByteArray, XPCError> DevelopmentSecurityService::createBookmark(const QString& path, bool isDirectory) {
    simulateDelay();

    if (options_.simulatePermissionFailures) {
        RBUM_DEBUG("Simulating permission failure for {}", path.toStdString());
        recordFailure(path, SecurityOperationType::Bookmark, XPCError::AccessDenied);
        return makeUnexpected(XPCError::AccessDenied);
    }

    if (options_.simulateBookmarkFailures) {
        RBUM_DEBUG("Simulating bookmark creation failure for {}", path.toStdString());
        recordFailure(path, SecurityOperationType::Bookmark, XPCError::BookmarkInvalid);
        return makeUnexpected(XPCError::BookmarkInvalid);
    }

    return SecurityService::createBookmark(path, isDirectory);
}

Expected<SecurityScopedAccess, XPCError> DevelopmentSecurityService::resolveBookmark(const QByteArray& bookmarkData) {
    simulateDelay();

    if (options_.simulateBookmarkFailures) {
        const QString path = bookmarkPath(bookmarkData);
        RBUM_DEBUG("Simulating stale bookmark for {}", path.toStdString());
        recordFailure(path, SecurityOperationType::Bookmark, XPCError::BookmarkStale);
        return makeUnexpected(XPCError::BookmarkStale);
    }

    return SecurityService::resolveBookmark(bookmarkData);
}

Expected<void, XPCError> DevelopmentSecurityService::startAccessing(SecurityScopedAccess& access) {
    simulateDelay();

    if (options_.simulateAccessFailures || options_.simulatePermissionFailures) {
        RBUM_DEBUG("Simulating access failure for {}", access.path().toStdString());
        recordFailure(access.path(), SecurityOperationType::Access, XPCError::AccessDenied);
        return makeUnexpected(XPCError::AccessDenied);
    }

    return SecurityService::startAccessing(access);
}

SecurityMode securityModeFromSettings(const Config::SecuritySettings& settings) {
    if (settings.mode.compare("development", Qt::CaseInsensitive) != 0) {
        return ProductionSecurity{};
    }

    DevelopmentOptions options;
    options.simulateBookmarkFailures = settings.simulateBookmarkFailures;
    options.simulateAccessFailures = settings.simulateAccessFailures;
    options.simulatePermissionFailures = settings.simulatePermissionFailures;
    options.artificialDelay = std::chrono::milliseconds(settings.artificialDelayMs);
    return DevelopmentSecurity{options};
}

std::shared_ptr<SecurityService> createSecurityService(const SecurityMode& mode,
                                                       std::shared_ptr<SecurityOperationRecorder> recorder) {
    return std::visit(Overloaded{
        [&recorder](const ProductionSecurity&) -> std::shared_ptr<SecurityService> {
            return std::make_shared<ProductionSecurityService>(recorder);
        },
        [&recorder](const DevelopmentSecurity& development) -> std::shared_ptr<SecurityService> {
            return std::make_shared<DevelopmentSecurityService>(recorder, development.options);
        }
    }, mode);
}

} // namespace Rbum
