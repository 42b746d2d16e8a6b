/**
 * @file path_selector.hpp
 * @brief Scope restriction for backup and restore operations.
 *
 * A PathSelector restricts a transfer to a single file or a single subdirectory. Selector
 * paths are always relative to a location's root; leading separators are stripped on
 * construction. A directory selector ends with a separator, a file selector never does.
 */

#ifndef PATH_SELECTOR_HPP
#define PATH_SELECTOR_HPP

#include <string>

/**
 * @brief Tagged value naming the whole tree, one file, or one directory.
 */
class PathSelector {
public:
    /**
     * @brief Selector variants.
     */
    enum class Kind {
        None,      ///< The whole tree.
        File,      ///< A single file; the path does not end with a separator.
        Directory  ///< A subdirectory; the path ends with a separator.
    };

    /**
     * @brief Constructs a selector for the whole tree.
     */
    PathSelector() = default;

    /**
     * @brief Creates a selector for a single file.
     *
     * @param path File path relative to the location root.
     * @return PathSelector The file selector.
     * @throws std::invalid_argument If the path is empty or ends with a separator.
     */
    static PathSelector file(const std::string& path);

    /**
     * @brief Creates a selector for a subdirectory.
     *
     * A path that is only separators selects the whole tree.
     *
     * @param path Directory path relative to the location root, ending with a separator.
     * @return PathSelector The directory selector.
     * @throws std::invalid_argument If the path does not end with a separator.
     */
    static PathSelector directory(const std::string& path);

    /**
     * @brief Creates a selector from user input.
     *
     * Empty input selects the whole tree, input ending with a separator selects a directory and
     * anything else selects a file.
     */
    static PathSelector parse(const std::string& path);

    Kind kind() const { return kind_; }
    bool isNone() const { return kind_ == Kind::None; }
    bool isFile() const { return kind_ == Kind::File; }
    bool isDirectory() const { return kind_ == Kind::Directory; }

    /**
     * @brief The relative path, empty for the whole tree.
     */
    const std::string& path() const { return path_; }

    /**
     * @brief The directory containing a file selector.
     *
     * Used for the receiving side of single-file transfers, so the file lands at its own
     * relative position instead of the top of the destination. A file at the top level
     * yields the whole-tree selector.
     *
     * @throws std::logic_error If this is not a file selector.
     */
    PathSelector parentDirectory() const;

    /**
     * @brief Appends this selector to a location root.
     *
     * The whole tree and directories always render with a trailing separator, so the
     * transfer tool copies directory contents rather than the directory itself.
     */
    std::string appendTo(const std::string& root) const;

    bool operator==(const PathSelector& other) const = default;

private:
    PathSelector(Kind kind, std::string path);

    Kind kind_ = Kind::None;
    std::string path_;
};

#endif // PATH_SELECTOR_HPP
