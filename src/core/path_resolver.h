/*!
 * \file path_resolver.h
 * \brief Объявляет StorageRoot (доверенная корневая директория), ResolvedPath (путь, гарантированно
 * находящийся внутри корня) и PathResolver, который строит ResolvedPath из проверенного Filename.
 *
 * PathResolver - второй эшелон защиты: даже для уже принятого NameValidator имени путь
 * канонизируется (с разрешением симлинков) и повторно проверяется на вложенность в корень.
 */
#ifndef PATH_RESOLVER_H
#define PATH_RESOLVER_H

#include "common_defs.h"
#include "error_kind.h"
#include "name_validator.h"

#include <string>
#include <filesystem>
#include <optional>

/*!
 * \class StorageRoot
 * \brief Одна из двух фиксированных директорий (рабочие файлы или резервные копии).
 *
 * Создается один раз при запуске: директория создается при отсутствии и канонизируется.
 * После создания неизменяема.
 */
class StorageRoot final {
public:
    /*!
     * \brief Подготавливает корневую директорию.
     * \param dir Путь из конфигурации (абсолютный или относительно CWD).
     * \param label Человекочитаемое имя корня для логов ("рабочая", "резервная").
     * \throw std::runtime_error если директорию невозможно создать или канонизировать.
     */
    StorageRoot(const std::filesystem::path& dir, std::string label);

    /*! \brief Канонический абсолютный путь к корню. */
    const std::filesystem::path& path() const noexcept { return canonical_path_; }

    const std::string& label() const noexcept { return label_; }

private:
    std::filesystem::path canonical_path_;
    std::string label_;
};

/*!
 * \class ResolvedPath
 * \brief Абсолютный канонический путь, являющийся строгим потомком своего StorageRoot.
 * Создается только PathResolver.
 */
class ResolvedPath final {
public:
    const std::filesystem::path& path() const noexcept { return path_; }

    /*! \brief Имя, из которого был получен путь. */
    const Filename& name() const noexcept { return name_; }

private:
    friend class PathResolver;
    ResolvedPath(std::filesystem::path path, Filename name)
        : path_(std::move(path)), name_(std::move(name)) {}

    std::filesystem::path path_;
    Filename name_;
};

/*!
 * \struct ResolutionResult
 * \brief Результат разрешения пути: Accepted(ResolvedPath) или Rejected(ErrorKind).
 */
struct ResolutionResult {
    bool accepted = false;                 /*!< `true`, если путь находится внутри корня. */
    ErrorKind error = ErrorKind::NONE;     /*!< PATH_TRAVERSAL или IO_FAILURE при отказе. */
    std::string message{};                 /*!< Пояснение для пользователя. */
    std::optional<ResolvedPath> path{};    /*!< Разрешенный путь (только при accepted == true). */
};

/*!
 * \class PathResolver
 * \brief Соединяет корень и имя файла, канонизирует результат и проверяет вложенность.
 *
 * - Если запись существует (в том числе как симлинк), путь канонизируется с разрешением симлинков;
 *   "висячий" симлинк отклоняется.
 * - Если записи нет (назначение для Backup/Restore), канонизируется родительская директория,
 *   после чего имя добавляется обратно.
 * - Результат должен начинаться с "корень + разделитель" и не совпадать с самим корнем.
 */
class PathResolver final {
public:
    PathResolver() = delete;

    static ResolutionResult resolve(const Filename& name, const StorageRoot& root);
};

#endif // PATH_RESOLVER_H
