/*!
 * \file backup_shell.cpp
 * \brief Реализация интерактивной оболочки BackupShell.
 */
#include "backup_shell.h"
#include "audit_log.h"
#include "file_utils.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace {

const std::string kLogPrefix = "[BackupShell] ";

std::string trimShell(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, (end - start + 1));
}

std::string toLowerShell(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// Номера пунктов меню: 1 - backup, 2 - delete, 3 - restore
std::optional<OperationKind> commandToOperation(const std::string& command_lower) {
    if (command_lower == "1") return OperationKind::BACKUP;
    if (command_lower == "2") return OperationKind::DELETE;
    if (command_lower == "3") return OperationKind::RESTORE;
    return operationKindFromString(command_lower);
}

} // namespace

BackupShell::BackupShell(FileOperationEngine& engine, AuditLog* audit_log,
                         std::istream& in, std::ostream& out, bool confirm_delete)
    : engine_(engine), audit_log_(audit_log), in_(in), out_(out), confirm_delete_(confirm_delete) {}

size_t BackupShell::run() {
    out_ << "Безопасное резервное копирование. Введите 'help' для списка команд, 'exit' для выхода.\n";
    std::string line;
    while (readLine("> ", line)) {
        if (!processLine(line)) {
            break;
        }
    }
    Logger::info(kLogPrefix + "Сеанс завершен. Успешных операций: " + std::to_string(succeeded_) +
                 ", неудачных: " + std::to_string(failed_) + ".");
    return failed_;
}

bool BackupShell::readLine(const std::string& prompt, std::string& line) {
    out_ << prompt;
    out_.flush();
    if (!std::getline(in_, line)) {
        out_ << "\n";
        Logger::info(kLogPrefix + "Обнаружен конец ввода.");
        return false;
    }
    if (line.size() > MAX_INPUT_LINE_LENGTH) {
        Logger::warn(kLogPrefix + "Отброшена строка ввода длиной " + std::to_string(line.size()) + " байт (максимум " +
                     std::to_string(MAX_INPUT_LINE_LENGTH) + ").");
        out_ << "ОШИБКА: строка ввода слишком длинная (максимум " << MAX_INPUT_LINE_LENGTH << " символов) и проигнорирована.\n";
        line.clear();
        return true;
    }
    line = trimShell(line);
    return true;
}

bool BackupShell::processLine(const std::string& raw_line) {
    std::string line = trimShell(raw_line);
    if (line.empty()) {
        return true;
    }

    size_t split_pos = line.find_first_of(" \t");
    std::string command = toLowerShell(line.substr(0, split_pos));
    std::string argument = (split_pos == std::string::npos) ? std::string() : trimShell(line.substr(split_pos));

    if (command == "exit" || command == "quit") {
        out_ << "Завершение работы.\n";
        return false;
    }
    if (command == "help") {
        printHelp();
        return true;
    }

    std::optional<OperationKind> kind = commandToOperation(command);
    if (!kind) {
        const std::string display_command = FileUtils::escapeForDisplay(command, AUDIT_FILENAME_DISPLAY_LIMIT);
        out_ << "Неизвестная команда: '" << display_command << "'. Введите 'help' для списка команд.\n";
        Logger::warn(kLogPrefix + "Неизвестная команда: '" + display_command + "'");
        if (audit_log_ != nullptr) {
            audit_log_->note("Попытка выполнить неизвестную команду: '" + command + "'");
        }
        return true;
    }

    std::string raw_name = argument;
    if (raw_name.empty()) {
        if (!readLine("Введите имя файла: ", raw_name)) {
            return false;
        }
    }
    return runOperation(*kind, raw_name);
}

bool BackupShell::runOperation(OperationKind kind, const std::string& raw_name) {
    // Подтверждение запрашивается только для существующего обычного файла с допустимым именем;
    // в остальных случаях ядро сразу сообщит об ошибке и запишет ее в аудит
    if (kind == OperationKind::DELETE && confirm_delete_ && engine_.checkDeletable(raw_name) == ErrorKind::NONE) {
        std::optional<bool> confirmed = confirmDeletion(raw_name);
        if (!confirmed) {
            recordCancellation(kind, raw_name);
            return false;
        }
        if (!*confirmed) {
            out_ << "Удаление отменено.\n";
            recordCancellation(kind, raw_name);
            return true;
        }
    }

    OperationResult result = engine_.execute(kind, raw_name);
    printResult(result);
    return true;
}

std::optional<bool> BackupShell::confirmDeletion(const std::string& raw_name) {
    std::string answer;
    if (!readLine("Вы уверены, что хотите удалить '" + raw_name + "'? (yes/no): ", answer)) {
        return std::nullopt;
    }
    return toLowerShell(answer) == "yes";
}

void BackupShell::recordCancellation(OperationKind kind, const std::string& raw_name) {
    Logger::info(kLogPrefix + operationKindToString(kind) + " '" + raw_name + "' отменена пользователем.");
    if (audit_log_ == nullptr) {
        return;
    }
    OperationRecord record;
    record.kind = kind;
    record.filename = raw_name;
    record.outcome = OperationOutcome::CANCELLED;
    record.timestamp = std::chrono::system_clock::now();
    if (!audit_log_->record(record)) {
        out_ << "ПРЕДУПРЕЖДЕНИЕ: не удалось записать отмену в журнал аудита.\n";
    }
}

void BackupShell::printResult(const OperationResult& result) {
    if (result.success) {
        ++succeeded_;
        out_ << "OK: " << result.user_message << "\n";
    } else {
        ++failed_;
        out_ << "ОШИБКА [" << errorKindToString(result.error) << "]: " << result.user_message << "\n";
    }
}

void BackupShell::printHelp() {
    out_ << "Команды:\n"
         << "  backup [имя]   (1)  Создать резервную копию файла из рабочей директории.\n"
         << "  delete [имя]   (2)  Удалить файл из рабочей директории.\n"
         << "  restore [имя]  (3)  Восстановить файл из резервной копии (рабочий файл перезаписывается).\n"
         << "  help                Показать эту справку.\n"
         << "  exit | quit         Выйти.\n"
         << "Имя файла: латинские буквы, цифры и символы '" << ALLOWED_FILENAME_PUNCTUATION
         << "', не более " << MAX_FILENAME_LENGTH << " символов, без путей.\n"
         << "Рабочая директория: " << engine_.settings().working_root.path().string() << "\n"
         << "Директория резервных копий: " << engine_.settings().backup_root.path().string() << "\n";
}
