/*!
 * \file file_operation_engine.cpp
 * \brief Реализация FileOperationEngine.
 */
#include "file_operation_engine.h"
#include "audit_log.h"
#include "file_utils.h"
#include "logger.h"

#include <filesystem>
#include <system_error>

namespace {

const std::string kLogPrefix = "[FileOperationEngine] ";

OperationResult failure(OperationStage stage, ErrorKind kind, const std::string& message,
                        const std::string& details = "") {
    OperationResult result;
    result.success = false;
    result.stage = stage;
    result.error = kind;
    result.user_message = message;
    result.error_details = details;
    return result;
}

// Проверка существующего источника: NONE, FILE_NOT_FOUND, NOT_REGULAR_FILE или IO_FAILURE
ErrorKind checkSourceFile(const ResolvedPath& source, std::string& details) {
    std::error_code ec;
    std::filesystem::file_status st = std::filesystem::status(source.path(), ec);
    if (st.type() == std::filesystem::file_type::not_found) {
        return ErrorKind::FILE_NOT_FOUND;
    }
    if (ec) {
        details = "Ошибка получения статуса '" + source.path().string() + "': " + ec.message();
        return ErrorKind::IO_FAILURE;
    }
    if (!std::filesystem::is_regular_file(st)) {
        return ErrorKind::NOT_REGULAR_FILE;
    }
    return ErrorKind::NONE;
}

} // namespace

std::string operationStageToString(OperationStage stage) {
    switch (stage) {
        case OperationStage::VALIDATING:   return "VALIDATING";
        case OperationStage::RESOLVING:    return "RESOLVING";
        case OperationStage::CHECKING:     return "CHECKING";
        case OperationStage::TRANSFERRING: return "TRANSFERRING";
        case OperationStage::REPORTING:    return "REPORTING";
    }
    return "UNKNOWN";
}

FileOperationEngine::FileOperationEngine(EngineSettings settings, AuditLog* audit_log)
    : settings_(std::move(settings)), audit_log_(audit_log) {
    Logger::info(kLogPrefix + "Инициализирован. Рабочая директория: '" + settings_.working_root.path().string() +
                 "', директория резервных копий: '" + settings_.backup_root.path().string() +
                 "', перезапись резервных копий: " + (settings_.allow_backup_overwrite ? "разрешена" : "запрещена"));
}

OperationResult FileOperationEngine::execute(OperationKind kind, const std::string& raw_name) {
    switch (kind) {
        case OperationKind::BACKUP:  return backupFile(raw_name);
        case OperationKind::DELETE:  return deleteFile(raw_name);
        case OperationKind::RESTORE: return restoreFile(raw_name);
    }
    return finish(kind, raw_name, failure(OperationStage::VALIDATING, ErrorKind::IO_FAILURE, "Неизвестный тип операции."));
}

OperationResult FileOperationEngine::backupFile(const std::string& raw_name) {
    return copyBetweenRoots(OperationKind::BACKUP, raw_name,
                            settings_.working_root, settings_.backup_root,
                            settings_.allow_backup_overwrite);
}

OperationResult FileOperationEngine::restoreFile(const std::string& raw_name) {
    // Резервная копия - источник истины, рабочий файл всегда перезаписывается
    return copyBetweenRoots(OperationKind::RESTORE, raw_name,
                            settings_.backup_root, settings_.working_root,
                            true);
}

OperationResult FileOperationEngine::copyBetweenRoots(OperationKind kind, const std::string& raw_name,
                                                      const StorageRoot& source_root, const StorageRoot& destination_root,
                                                      bool overwrite_existing) {
    ValidationResult validation = NameValidator::validate(raw_name);
    if (!validation.accepted) {
        return finish(kind, raw_name, failure(OperationStage::VALIDATING, validation.error, validation.message));
    }
    const Filename& name = *validation.filename;

    ResolutionResult source = PathResolver::resolve(name, source_root);
    if (!source.accepted) {
        return finish(kind, raw_name, failure(OperationStage::RESOLVING, source.error, source.message));
    }
    ResolutionResult destination = PathResolver::resolve(name, destination_root);
    if (!destination.accepted) {
        return finish(kind, raw_name, failure(OperationStage::RESOLVING, destination.error, destination.message));
    }

    std::string details;
    ErrorKind source_check = checkSourceFile(*source.path, details);
    if (source_check == ErrorKind::FILE_NOT_FOUND) {
        std::string what = (kind == OperationKind::RESTORE) ? "Резервная копия '" : "Исходный файл '";
        return finish(kind, raw_name, failure(OperationStage::CHECKING, source_check,
                                              what + name.str() + "' не существует."));
    }
    if (source_check != ErrorKind::NONE) {
        return finish(kind, raw_name, failure(OperationStage::CHECKING, source_check,
                                              errorKindDescription(source_check) + ": '" + name.str() + "'.", details));
    }

    std::error_code ec;
    std::filesystem::file_status dest_status = std::filesystem::symlink_status(destination.path->path(), ec);
    if (std::filesystem::exists(dest_status)) {
        if (!std::filesystem::is_regular_file(dest_status)) {
            return finish(kind, raw_name, failure(OperationStage::CHECKING, ErrorKind::NOT_REGULAR_FILE,
                                                  "Назначение '" + name.str() + "' существует и не является обычным файлом."));
        }
        if (!overwrite_existing) {
            return finish(kind, raw_name, failure(OperationStage::CHECKING, ErrorKind::ALREADY_EXISTS,
                                                  "Резервная копия '" + name.str() + "' уже существует. Перезапись запрещена конфигурацией."));
        }
        Logger::info(kLogPrefix + "Файл назначения '" + destination.path->path().string() + "' будет перезаписан.");
    }

    FileCopyResult copy = FileUtils::copyFileViaTemporary(source.path->path(), destination.path->path());
    if (!copy.success) {
        return finish(kind, raw_name, failure(OperationStage::TRANSFERRING, ErrorKind::IO_FAILURE,
                                              "Не удалось скопировать '" + name.str() + "'. Файл назначения не изменен.",
                                              copy.error_details));
    }

    OperationResult result;
    result.success = true;
    result.stage = OperationStage::REPORTING;
    result.bytes_copied = copy.bytes_copied;
    result.user_message = (kind == OperationKind::RESTORE ? "Файл восстановлен из резервной копии: '" : "Резервная копия создана: '") +
                          name.str() + "' (" + std::to_string(copy.bytes_copied) + " байт).";
    return finish(kind, raw_name, std::move(result));
}

ErrorKind FileOperationEngine::checkDeletable(const std::string& raw_name) const {
    ValidationResult validation = NameValidator::validate(raw_name);
    if (!validation.accepted) {
        return validation.error;
    }
    ResolutionResult target = PathResolver::resolve(*validation.filename, settings_.working_root);
    if (!target.accepted) {
        return target.error;
    }
    std::string details;
    return checkSourceFile(*target.path, details);
}

OperationResult FileOperationEngine::deleteFile(const std::string& raw_name) {
    const OperationKind kind = OperationKind::DELETE;
    ValidationResult validation = NameValidator::validate(raw_name);
    if (!validation.accepted) {
        return finish(kind, raw_name, failure(OperationStage::VALIDATING, validation.error, validation.message));
    }
    const Filename& name = *validation.filename;

    ResolutionResult target = PathResolver::resolve(name, settings_.working_root);
    if (!target.accepted) {
        return finish(kind, raw_name, failure(OperationStage::RESOLVING, target.error, target.message));
    }

    std::string details;
    ErrorKind check = checkSourceFile(*target.path, details);
    if (check == ErrorKind::FILE_NOT_FOUND) {
        return finish(kind, raw_name, failure(OperationStage::CHECKING, check,
                                              "Файл '" + name.str() + "' не существует."));
    }
    if (check != ErrorKind::NONE) {
        return finish(kind, raw_name, failure(OperationStage::CHECKING, check,
                                              errorKindDescription(check) + ": '" + name.str() + "'.", details));
    }

    std::error_code ec;
    bool removed = std::filesystem::remove(target.path->path(), ec);
    if (ec || !removed) {
        std::string cause = ec ? ec.message() : "файл исчез до удаления";
        return finish(kind, raw_name, failure(OperationStage::TRANSFERRING, ErrorKind::IO_FAILURE,
                                              "Не удалось удалить '" + name.str() + "'.",
                                              "Ошибка удаления '" + target.path->path().string() + "': " + cause));
    }

    OperationResult result;
    result.success = true;
    result.stage = OperationStage::REPORTING;
    result.user_message = "Файл удален: '" + name.str() + "'.";
    return finish(kind, raw_name, std::move(result));
}

OperationResult FileOperationEngine::finish(OperationKind kind, const std::string& raw_name, OperationResult result) {
    result.record.kind = kind;
    result.record.filename = raw_name;
    result.record.outcome = result.success ? OperationOutcome::SUCCESS : OperationOutcome::FAILURE;
    result.record.error = result.error;
    result.record.reason = result.success ? std::string() : result.user_message;
    result.record.timestamp = std::chrono::system_clock::now();

    const std::string display_name = FileUtils::escapeForDisplay(raw_name, AUDIT_FILENAME_DISPLAY_LIMIT);
    if (result.success) {
        Logger::info(kLogPrefix + operationKindToString(kind) + " '" + display_name + "': " + result.user_message);
    } else {
        std::string line = kLogPrefix + operationKindToString(kind) + " '" + display_name + "' отклонена на этапе " +
                           operationStageToString(result.stage) + " (" + errorKindToString(result.error) + "): " +
                           result.user_message;
        if (!result.error_details.empty()) {
            line += " Подробности: " + result.error_details;
        }
        if (result.error == ErrorKind::IO_FAILURE) {
            Logger::error(line);
        } else {
            Logger::warn(line);
        }
    }

    if (audit_log_ != nullptr && !audit_log_->record(result.record)) {
        if (!result.error_details.empty()) {
            result.error_details += " ";
        }
        result.error_details += "Запись в журнал аудита не выполнена.";
    }
    return result;
}
