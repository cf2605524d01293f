/*!
 * \file file_utils.cpp
 * \brief Реализация утилит для работы с файловой системой.
 */
#include "file_utils.h"
#include "logger.h"

#include <vector>
#include <fstream>
#include <system_error>
#include <iomanip>
#include <sstream>
#include <functional>
#include <cstdint>

// Проверка на доступность <filesystem> во время компиляции
#ifndef __cpp_lib_filesystem
    #error "C++17 std::filesystem is required for file_utils.cpp. Check your compiler and C++ standard settings."
#endif

namespace FileUtils {

    std::filesystem::path ensureDirectory(const std::filesystem::path& dir) {
        const std::string log_prefix = "[FileUtils::ensureDirectory] ";
        if (dir.empty()) {
            Logger::error(log_prefix + "Получен пустой путь к директории.");
            throw std::runtime_error("Путь к директории не может быть пустым.");
        }

        std::error_code ec;
        bool exists = std::filesystem::exists(dir, ec);
        if (ec) {
            Logger::error(log_prefix + "Ошибка проверки существования директории '" + dir.string() + "': " + ec.message());
            throw std::runtime_error("Ошибка доступа к директории: " + dir.string());
        }

        if (!exists) {
            Logger::info(log_prefix + "Директория '" + dir.string() + "' не существует. Попытка создать ее.");
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                Logger::error(log_prefix + "Не удалось создать директорию '" + dir.string() + "': " + ec.message());
                throw std::runtime_error("Не удалось создать директорию: " + dir.string());
            }
            Logger::info(log_prefix + "Успешно создана директория: '" + dir.string() + "'");
        } else if (!std::filesystem::is_directory(dir, ec) || ec) {
            Logger::error(log_prefix + "Путь '" + dir.string() + "' существует, но НЕ является директорией!");
            throw std::runtime_error("Путь не является директорией: " + dir.string());
        }

        std::filesystem::path canonical_dir = std::filesystem::canonical(dir, ec);
        if (ec) {
            Logger::error(log_prefix + "Ошибка канонизации директории '" + dir.string() + "': " + ec.message());
            throw std::runtime_error("Не удалось канонизировать путь к директории: " + dir.string());
        }
        Logger::debug(log_prefix + "Директория '" + dir.string() + "' разрешена в '" + canonical_dir.string() + "'");
        return canonical_dir;
    }

    bool isStrictlyWithinRoot(const std::filesystem::path& canonical_target,
                              const std::filesystem::path& canonical_root) {
        std::string target_str_normalized = canonical_target.lexically_normal().string();
        std::string root_str_normalized = canonical_root.lexically_normal().string();
        if (root_str_normalized.empty()) {
            return false;
        }

        std::string root_prefix_to_check = root_str_normalized;
        if (root_prefix_to_check.back() != std::filesystem::path::preferred_separator) {
            root_prefix_to_check += std::filesystem::path::preferred_separator;
        }
        return target_str_normalized.length() > root_prefix_to_check.length() &&
               target_str_normalized.compare(0, root_prefix_to_check.length(), root_prefix_to_check) == 0;
    }

    std::filesystem::path temporaryPathFor(const std::filesystem::path& destination) {
        std::ostringstream oss;
        oss << TEMP_COPY_PREFIX << std::hex << std::setw(16) << std::setfill('0')
            << static_cast<std::uint64_t>(std::hash<std::string>{}(destination.filename().string()));
        return destination.parent_path() / oss.str();
    }

    FileCopyResult copyFileViaTemporary(const std::filesystem::path& source,
                                        const std::filesystem::path& destination) {
        const std::string log_prefix = "[FileUtils::copyFileViaTemporary] ";
        FileCopyResult result;

        std::filesystem::path temp_path = temporaryPathFor(destination);

        // Временный путь не должен быть симлинком или директорией: запись по нему ушла бы за пределы назначения
        std::error_code ec;
        std::filesystem::file_status temp_status = std::filesystem::symlink_status(temp_path, ec);
        if (std::filesystem::exists(temp_status) && !std::filesystem::is_regular_file(temp_status)) {
            result.error_details = "Временный путь '" + temp_path.string() + "' занят объектом, не являющимся обычным файлом.";
            Logger::error(log_prefix + result.error_details);
            return result;
        }

        std::ifstream in_file(source, std::ios::binary);
        if (!in_file.is_open()) {
            result.error_details = "Не удалось открыть исходный файл '" + source.string() + "' для чтения.";
            Logger::error(log_prefix + result.error_details);
            return result;
        }

        std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
        if (!out_file.is_open()) {
            result.error_details = "Не удалось открыть временный файл '" + temp_path.string() + "' для записи.";
            Logger::error(log_prefix + result.error_details);
            return result;
        }

        auto discard_temp = [&temp_path, &log_prefix]() {
            std::error_code ec_remove;
            std::filesystem::remove(temp_path, ec_remove);
            if (ec_remove) {
                Logger::error(log_prefix + "Не удалось удалить частично записанный временный файл '" + temp_path.string() + "': " + ec_remove.message());
            } else {
                Logger::debug(log_prefix + "Частично записанный временный файл '" + temp_path.string() + "' удален.");
            }
        };

        std::vector<char> buffer(COPY_BUFFER_SIZE);
        while (in_file) {
            in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize chunk = in_file.gcount();
            if (chunk <= 0) {
                break;
            }
            out_file.write(buffer.data(), chunk);
            if (!out_file) {
                result.error_details = "Ошибка записи во временный файл '" + temp_path.string() + "' после " + std::to_string(result.bytes_copied) + " байт.";
                Logger::error(log_prefix + result.error_details);
                out_file.close();
                discard_temp();
                result.bytes_copied = 0;
                return result;
            }
            result.bytes_copied += static_cast<std::uintmax_t>(chunk);
        }

        if (in_file.bad()) {
            result.error_details = "Ошибка чтения исходного файла '" + source.string() + "'.";
            Logger::error(log_prefix + result.error_details);
            out_file.close();
            discard_temp();
            result.bytes_copied = 0;
            return result;
        }

        out_file.close();
        if (!out_file) {
            result.error_details = "Не удалось корректно сбросить и закрыть временный файл '" + temp_path.string() + "'.";
            Logger::error(log_prefix + result.error_details);
            discard_temp();
            result.bytes_copied = 0;
            return result;
        }

        std::filesystem::permissions(temp_path, std::filesystem::status(source, ec).permissions(),
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            Logger::warn(log_prefix + "Не удалось перенести права доступа на '" + temp_path.string() + "': " + ec.message());
        }

        std::filesystem::rename(temp_path, destination, ec);
        if (ec) {
            result.error_details = "Не удалось переименовать временный файл в '" + destination.string() + "': " + ec.message();
            Logger::error(log_prefix + result.error_details);
            discard_temp();
            result.bytes_copied = 0;
            return result;
        }

        result.success = true;
        Logger::debug(log_prefix + "Скопировано " + std::to_string(result.bytes_copied) + " байт: '" +
                      source.string() + "' -> '" + destination.string() + "'");
        return result;
    }

    std::string escapeForDisplay(const std::string& raw, size_t max_length) {
        std::ostringstream oss;
        size_t written = 0;
        for (unsigned char c : raw) {
            std::ostringstream piece;
            if (c == '\\' || c == '\'' || c == '"') {
                piece << '\\' << static_cast<char>(c);
            } else if (c < 0x20 || c == 0x7F) {
                piece << "\\x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                      << static_cast<int>(c);
            } else {
                piece << static_cast<char>(c);
            }
            // Экранированная последовательность либо помещается целиком, либо не выводится
            const std::string chunk = piece.str();
            if (written + chunk.size() > max_length) {
                oss << "...";
                break;
            }
            oss << chunk;
            written += chunk.size();
        }
        return oss.str();
    }

} // namespace FileUtils
