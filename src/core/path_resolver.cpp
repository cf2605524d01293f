/*!
 * \file path_resolver.cpp
 * \brief Реализация StorageRoot и PathResolver.
 */
#include "path_resolver.h"
#include "file_utils.h"
#include "logger.h"

#include <system_error>

namespace {

const std::string kLogPrefix = "[PathResolver] ";

ResolutionResult reject(ErrorKind kind, const std::string& detail) {
    ResolutionResult result;
    result.accepted = false;
    result.error = kind;
    result.message = errorKindDescription(kind) + ": " + detail;
    return result;
}

} // namespace

StorageRoot::StorageRoot(const std::filesystem::path& dir, std::string label)
    : canonical_path_(FileUtils::ensureDirectory(dir)), label_(std::move(label)) {
    Logger::info("[StorageRoot] Корневая директория (" + label_ + "): '" + canonical_path_.string() + "'");
}

ResolutionResult PathResolver::resolve(const Filename& name, const StorageRoot& root) {
    const std::filesystem::path joined = root.path() / name.str();
    Logger::debug(kLogPrefix + "Разрешение '" + name.str() + "' в корне (" + root.label() + "): '" + joined.string() + "'");

    std::error_code ec;
    std::filesystem::file_status entry_status = std::filesystem::symlink_status(joined, ec);
    bool entry_missing = entry_status.type() == std::filesystem::file_type::not_found;
    if (ec && !entry_missing) {
        Logger::error(kLogPrefix + "Ошибка получения статуса '" + joined.string() + "': " + ec.message());
        return reject(ErrorKind::IO_FAILURE, "не удалось получить сведения о файле '" + name.str() + "' (" + ec.message() + ").");
    }

    std::filesystem::path candidate;
    if (!entry_missing) {
        candidate = std::filesystem::canonical(joined, ec);
        if (ec) {
            if (std::filesystem::is_symlink(entry_status)) {
                Logger::error(kLogPrefix + "Симлинк '" + joined.string() + "' не может быть разрешен (висячий или циклический): " + ec.message());
                return reject(ErrorKind::PATH_TRAVERSAL, "'" + name.str() + "' является неразрешимой символической ссылкой.");
            }
            Logger::error(kLogPrefix + "Ошибка канонизации '" + joined.string() + "': " + ec.message());
            return reject(ErrorKind::IO_FAILURE, "не удалось канонизировать путь к '" + name.str() + "' (" + ec.message() + ").");
        }
    } else {
        // Назначение еще не существует: канонизируем родителя и добавляем имя обратно
        std::filesystem::path canonical_parent = std::filesystem::canonical(joined.parent_path(), ec);
        if (ec) {
            Logger::error(kLogPrefix + "Ошибка канонизации родительской директории '" + joined.parent_path().string() + "': " + ec.message());
            return reject(ErrorKind::IO_FAILURE, "корневая директория (" + root.label() + ") недоступна (" + ec.message() + ").");
        }
        candidate = canonical_parent / name.str();
    }

    if (!FileUtils::isStrictlyWithinRoot(candidate, root.path())) {
        Logger::error(kLogPrefix + "Попытка нарушения песочницы: имя '" + name.str() + "' разрешается в '" + candidate.string() +
                      "', что находится вне корня (" + root.label() + ") '" + root.path().string() + "'.");
        return reject(ErrorKind::PATH_TRAVERSAL, "'" + name.str() + "' указывает за пределы разрешенной директории.");
    }

    Logger::debug(kLogPrefix + "Путь разрешен: '" + candidate.string() + "'");
    ResolutionResult result;
    result.accepted = true;
    result.path = ResolvedPath(candidate, name);
    return result;
}
