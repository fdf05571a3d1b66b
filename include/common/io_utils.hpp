#pragma once

#include <filesystem>
#include <string>

namespace codegrade {

/**
 * @brief Read the whole content of a text file
 * @param path path of the text file
 * @return content of the file (no encoding assumed)
 * @throw io_error if the file cannot be opened
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief Write text to a file, replacing its content
 * @throw io_error if the file cannot be created or fully written
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief Ensure subpath never climbs to a parent directory
 * File names are derived from request data, a name containing "../"
 * could otherwise place files outside TEMP_DIR.
 * @param subpath the file name to check
 * @return subpath unchanged
 * @throw std::invalid_argument if subpath is not safe
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief A scratch directory owned by one execution, removed with all its
 * content when this object dies.
 * Removal happens on every exit path: normal return, exception, timeout
 * kill or cancellation. A failed removal is logged and swallowed, it never
 * changes the outcome of the execution it cleans up after.
 */
struct scoped_workdir {
    /**
     * @brief Create parent/id
     * @param id must be unique per execution, e.g. a fresh uuid
     * @throw io_error if the directory cannot be created
     */
    scoped_workdir(const std::filesystem::path &parent, const std::string &id);
    scoped_workdir(const scoped_workdir &) = delete;
    scoped_workdir &operator=(const scoped_workdir &) = delete;
    ~scoped_workdir();

    const std::filesystem::path &path() const;

    /**
     * @brief Write a file into this directory
     * @return path of the written file
     * @throw io_error if the file cannot be written
     */
    std::filesystem::path write(const std::string &name, const std::string &content) const;

    /**
     * @brief Remove the directory now
     * @return false if it could not be removed, the error is logged
     */
    bool remove() noexcept;

private:
    std::filesystem::path dir;
    bool removed = false;
};

}  // namespace codegrade
