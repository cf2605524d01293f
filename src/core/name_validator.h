/*!
 * \file name_validator.h
 * \brief Объявляет непрозрачный тип Filename и класс NameValidator, проверяющий имена файлов,
 * полученные от пользователя.
 *
 * Экземпляр Filename может создать только NameValidator, поэтому любой код, принимающий
 * `const Filename&`, работает исключительно с уже проверенным именем. Никакой код ниже
 * по потоку не анализирует "сырые" строки повторно.
 */
#ifndef NAME_VALIDATOR_H
#define NAME_VALIDATOR_H

#include "common_defs.h"
#include "error_kind.h"

#include <string>
#include <optional>

class NameValidator;

/*!
 * \class Filename
 * \brief Проверенное имя файла: непустое, ограниченной длины, только символы белого списка,
 * без разделителей пути, без "..", не абсолютное.
 */
class Filename final {
public:
    /*! \brief Проверенное имя как строка. */
    const std::string& str() const noexcept { return value_; }

    bool operator==(const Filename& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Filename& other) const noexcept { return value_ != other.value_; }

private:
    friend class NameValidator;
    explicit Filename(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/*!
 * \struct ValidationResult
 * \brief Результат проверки имени: Accepted(Filename) или Rejected(ErrorKind).
 */
struct ValidationResult {
    bool accepted = false;                 /*!< `true`, если имя принято. */
    ErrorKind error = ErrorKind::NONE;     /*!< Причина отказа (NONE при успехе). */
    std::string message{};                 /*!< Пояснение для пользователя. */
    std::optional<Filename> filename{};    /*!< Проверенное имя (только при accepted == true). */
};

/*!
 * \class NameValidator
 * \brief Чистая классификация строки без обращения к файловой системе.
 *
 * Правила проверяются по порядку, первое нарушение определяет результат:
 * 1. Пустая строка или только пробельные символы -> EMPTY_NAME.
 * 2. Длина больше MAX_FILENAME_LENGTH -> NAME_TOO_LONG.
 * 3. Начинается с маркера корня ('/', '\\', '~', "X:") -> ABSOLUTE_PATH.
 * 4. Содержит '/' или '\\' -> PATH_TRAVERSAL.
 * 5. Равно "." или содержит ".." -> PATH_TRAVERSAL.
 * 6. Содержит символ вне белого списка (буквы и цифры ASCII плюс ALLOWED_FILENAME_PUNCTUATION) -> INVALID_CHARACTER.
 */
class NameValidator final {
public:
    NameValidator() = delete;

    /*!
     * \brief Проверяет имя файла, полученное от пользователя.
     * \param raw Строка в том виде, в каком ее передала оболочка (может содержать NUL и управляющие символы).
     * \return ValidationResult с Filename при успехе.
     */
    static ValidationResult validate(const std::string& raw);

    /*! \brief Входит ли символ в белый список символов имени файла. */
    static bool isAllowedCharacter(char c) noexcept;
};

#endif // NAME_VALIDATOR_H
