/*!
 * \file file_utils.h
 * \brief Объявляет утилиты для работы с файловой системой: подготовка корневых директорий,
 * проверка вложенности путей ("песочница"), безопасное копирование через временный файл
 * и экранирование пользовательских строк для вывода в логи.
 *
 * Используется C++17 `<filesystem>`. Функции не выполняют проверку имен файлов:
 * это задача NameValidator и PathResolver.
 */
#ifndef FILE_UTILS_H
#define FILE_UTILS_H

#include "common_defs.h"
#include <string>
#include <filesystem>
#include <cstdint>
#include <stdexcept>

/*!
 * \struct FileCopyResult
 * \brief Результат побайтового копирования файла.
 */
struct FileCopyResult {
    bool success = false;               /*!< `true`, если содержимое полностью скопировано и файл назначения на месте. */
    std::uintmax_t bytes_copied = 0;    /*!< Количество записанных байт. */
    std::string error_details{};        /*!< Описание ошибки для лога (пусто при успехе). */
};

/*!
 * \brief Пространство имен для утилит работы с файлами.
 */
namespace FileUtils {

    /*!
     * \brief Гарантирует существование директории и возвращает ее канонический абсолютный путь.
     * Если директория отсутствует, она создается (вместе с родительскими).
     * \param dir Абсолютный или относительный (от CWD) путь к директории.
     * \return Канонический путь (симлинки разрешены).
     * \throw std::runtime_error если путь пуст, существует, но не является директорией,
     * или если создать/канонизировать директорию не удалось.
     */
    std::filesystem::path ensureDirectory(const std::filesystem::path& dir);

    /*!
     * \brief Проверяет, что канонический путь является строгим потомком канонического корня.
     * Сравнение выполняется по строковому префиксу "корень + разделитель", поэтому
     * "/data/root_evil" не считается вложенным в "/data/root". Сам корень потомком не считается.
     * \param canonical_target Канонизированный проверяемый путь.
     * \param canonical_root Канонизированный корень.
     */
    bool isStrictlyWithinRoot(const std::filesystem::path& canonical_target,
                              const std::filesystem::path& canonical_root);

    /*!
     * \brief Возвращает путь временного файла для копирования в `destination`.
     * Файл лежит в той же директории и называется TEMP_COPY_PREFIX + 16 шестнадцатеричных цифр хеша
     * имени назначения, поэтому длина его имени не превышает 20 байт при любой длине `destination`.
     */
    std::filesystem::path temporaryPathFor(const std::filesystem::path& destination);

    /*!
     * \brief Копирует содержимое файла байт в байт: сначала во временный файл рядом с назначением
     * (temporaryPathFor(destination)), затем атомарно переименовывает его в `destination`.
     * При любой ошибке временный файл удаляется, а существующий файл назначения остается нетронутым.
     * \param source Путь к исходному обычному файлу.
     * \param destination Путь к файлу назначения (будет перезаписан при успехе).
     * \return FileCopyResult. Исключения файловой системы не выбрасываются.
     */
    FileCopyResult copyFileViaTemporary(const std::filesystem::path& source,
                                        const std::filesystem::path& destination);

    /*!
     * \brief Экранирует строку для безопасного вывода в лог: управляющие байты (включая NUL,
     * перевод строки и DEL) заменяются на `\xNN`, кавычки и обратный слэш экранируются.
     * Байты UTF-8 (>= 0x80) выводятся как есть. Результат длиннее
     * `max_length` символов обрезается с добавлением "..."; обрезка не разрывает
     * экранированную последовательность.
     */
    std::string escapeForDisplay(const std::string& raw, size_t max_length);

} // namespace FileUtils

#endif // FILE_UTILS_H
