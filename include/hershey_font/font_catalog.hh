/**
 * @file font_catalog.hh
 * @brief Named collections of Hershey fonts and loading fonts by name.
 *
 * Hershey fonts are usually shipped as a bundle of .jhf files. A font_archive
 * gives access to such a bundle; a font_catalog lists the fonts of an
 * archive and loads them into a stroke_font by name.
 *
 * @section catalog_archives Archives
 *
 * | Archive           | Source                                                  |
 * |-------------------|---------------------------------------------------------|
 * | blob_archive      | Opaque bytes plus a decoder function you supply         |
 * | directory_archive | Every *.jhf file in one directory, named by file stem   |
 *
 * The container format, compression and transport encoding of a blob are
 * the decoder's business; whatever it throws reaches the caller unchanged.
 *
 * @section catalog_usage Usage Example
 *
 * @code{.cpp}
 * font_catalog catalog(std::make_shared<directory_archive>("fonts"));
 *
 * for (const auto& name : catalog.list_names()) {
 *     std::cout << name << "\n";
 * }
 *
 * stroke_font font;
 * auto loaded = catalog.load_by_name(font);            // first font
 * catalog.load_by_name(font, "rowmans");               // by name
 * catalog.load_by_name(font, "missing");               // throws font_not_found
 * @endcode
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <hershey_font/stroke_font.hh>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hershey_font {
    /**
     * @brief Read access to a bundle of named font description files.
     */
    class HERSHEY_FONT_EXPORT font_archive {
    public:
        virtual ~font_archive();

        /**
         * @brief Names of all fonts in archive order.
         *
         * The first name is the archive's default font.
         */
        [[nodiscard]] virtual std::vector<std::string> names() const = 0;

        /**
         * @brief Raw .jhf content of one font.
         * @throws font_not_found if the archive has no such entry
         */
        [[nodiscard]] virtual std::vector<uint8_t> extract(const std::string& name) const = 0;
    };

    /**
     * @brief One named file of a decoded archive.
     */
    struct HERSHEY_FONT_EXPORT archive_entry {
        std::string name;
        std::vector<uint8_t> data;
    };

    /// Turns an encoded archive into its entries, in archive order
    using archive_decoder = std::function<std::vector<archive_entry>(std::span<const uint8_t>)>;

    /**
     * @brief Archive held as an opaque blob, decoded on access.
     *
     * The blob is decoded again on every names() / extract() call.
     */
    class HERSHEY_FONT_EXPORT blob_archive : public font_archive {
    public:
        /**
         * @param blob Encoded archive bytes
         * @param decoder Decoder for @p blob, must not be empty
         * @throws std::invalid_argument if @p decoder is empty
         */
        blob_archive(std::vector<uint8_t> blob, archive_decoder decoder);

        [[nodiscard]] std::vector<std::string> names() const override;
        [[nodiscard]] std::vector<uint8_t> extract(const std::string& name) const override;

    private:
        std::vector<uint8_t> m_blob;
        archive_decoder m_decoder;
    };

    /**
     * @brief Directory of extracted .jhf files.
     *
     * Entries are the regular files with a `.jhf` extension, named by their
     * stem and ordered by name.
     */
    class HERSHEY_FONT_EXPORT directory_archive : public font_archive {
    public:
        explicit directory_archive(std::filesystem::path dir);

        /// @throws std::runtime_error if the directory does not exist
        [[nodiscard]] std::vector<std::string> names() const override;
        [[nodiscard]] std::vector<uint8_t> extract(const std::string& name) const override;

        [[nodiscard]] const std::filesystem::path& path() const;

    private:
        std::filesystem::path m_dir;
    };

    /**
     * @brief Font names of an archive and loading by name.
     *
     * The name list is read from the archive once, on first use, and kept
     * by this catalog instance.
     */
    class HERSHEY_FONT_EXPORT font_catalog {
    public:
        explicit font_catalog(std::shared_ptr<const font_archive> archive);

        /// Names of all fonts, the first one is the default
        [[nodiscard]] const std::vector<std::string>& list_names() const;

        [[nodiscard]] bool has_font(std::string_view name) const;

        /**
         * @brief Name of the default (first) font.
         * @throws font_not_found if the catalog is empty
         */
        [[nodiscard]] std::string default_name() const;

        /**
         * @brief Load a font into @p font.
         *
         * @param font Font to load into
         * @param name Font name, empty selects the default font
         * @param options Load options passed to stroke_font::load
         * @return Name of the loaded font
         * @throws font_not_found if @p name is not in the catalog; @p font is not touched
         * @throws font_parse_error if the font data has a malformed directive
         */
        std::string load_by_name(stroke_font& font, std::string_view name = {},
                                 const load_options& options = {}) const;

    private:
        std::shared_ptr<const font_archive> m_archive;
        mutable std::optional<std::vector<std::string>> m_names;
    };
} // namespace hershey_font
