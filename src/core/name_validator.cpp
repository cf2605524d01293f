/*!
 * \file name_validator.cpp
 * \brief Реализация NameValidator.
 */
#include "name_validator.h"
#include "file_utils.h" // Для FileUtils::escapeForDisplay
#include "logger.h"

#include <algorithm>
#include <cctype>

namespace {

const std::string kLogPrefix = "[NameValidator] ";

ValidationResult reject(const std::string& raw, ErrorKind kind, const std::string& detail) {
    ValidationResult result;
    result.accepted = false;
    result.error = kind;
    result.message = errorKindDescription(kind) + ": " + detail;
    Logger::warn(kLogPrefix + "Имя отклонено (" + errorKindToString(kind) + "): '" +
                 FileUtils::escapeForDisplay(raw, AUDIT_FILENAME_DISPLAY_LIMIT) + "'. " + detail);
    return result;
}

bool isAsciiLetter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// "C:", "c:foo" и т.п.
bool hasDriveLetterPrefix(const std::string& raw) noexcept {
    return raw.size() >= 2 && isAsciiLetter(raw[0]) && raw[1] == ':';
}

} // namespace

bool NameValidator::isAllowedCharacter(char c) noexcept {
    if (isAsciiLetter(c) || (c >= '0' && c <= '9')) {
        return true;
    }
    return ALLOWED_FILENAME_PUNCTUATION.find(c) != std::string::npos;
}

ValidationResult NameValidator::validate(const std::string& raw) {
    // 1. Пустое имя. std::isspace вызывается для unsigned char, NUL пробелом не считается.
    bool only_whitespace = std::all_of(raw.begin(), raw.end(),
                                       [](unsigned char c) { return std::isspace(c) != 0; });
    if (raw.empty() || only_whitespace) {
        return reject(raw, ErrorKind::EMPTY_NAME, "укажите имя файла.");
    }

    // 2. Длина проверяется до любого посимвольного анализа
    if (raw.size() > MAX_FILENAME_LENGTH) {
        return reject(raw, ErrorKind::NAME_TOO_LONG,
                      "длина " + std::to_string(raw.size()) + " байт, максимум " + std::to_string(MAX_FILENAME_LENGTH) + ".");
    }

    // 3. Маркеры корня. Проверяются раньше разделителей: иначе "/etc/passwd" получил бы
    // PATH_TRAVERSAL, а любое имя, начинающееся с '/', обязано давать ABSOLUTE_PATH
    // (порядок правил зафиксирован в DESIGN.md, решение 1).
    if (raw[0] == '/' || raw[0] == '\\' || raw[0] == '~' || hasDriveLetterPrefix(raw)) {
        return reject(raw, ErrorKind::ABSOLUTE_PATH, "имя не может начинаться с маркера корня файловой системы.");
    }

    // 4. Разделители пути
    if (raw.find_first_of("/\\") != std::string::npos) {
        return reject(raw, ErrorKind::PATH_TRAVERSAL, "имя не может содержать разделители пути ('/' или '\\').");
    }

    // 5. Ссылки на текущую/родительскую директорию
    if (raw == "." || raw.find("..") != std::string::npos) {
        return reject(raw, ErrorKind::PATH_TRAVERSAL, "последовательности '.' и '..' не допускаются.");
    }

    // 6. Белый список символов
    auto bad_char_it = std::find_if(raw.begin(), raw.end(), [](char c) { return !isAllowedCharacter(c); });
    if (bad_char_it != raw.end()) {
        return reject(raw, ErrorKind::INVALID_CHARACTER,
                      "позиция " + std::to_string(bad_char_it - raw.begin()) +
                      "; разрешены только латинские буквы, цифры и символы '" + ALLOWED_FILENAME_PUNCTUATION + "'.");
    }

    ValidationResult result;
    result.accepted = true;
    result.filename = Filename(raw);
    Logger::debug(kLogPrefix + "Имя принято: '" + raw + "'");
    return result;
}
