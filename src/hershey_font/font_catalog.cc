//
// Created by igor on 19/10/2026.
//

#include <hershey_font/font_catalog.hh>
#include <hershey_font/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

#include "utils/file_io.hh"

namespace hershey_font {

    namespace {
        constexpr std::string_view FONT_EXTENSION = ".jhf";
    }

    font_archive::~font_archive() = default;

    // ========================================================================
    // blob_archive
    // ========================================================================

    blob_archive::blob_archive(std::vector<uint8_t> blob, archive_decoder decoder)
        : m_blob(std::move(blob)),
          m_decoder(std::move(decoder)) {
        THROW_IF(!m_decoder, std::invalid_argument, "blob_archive requires a decoder");
    }

    std::vector<std::string> blob_archive::names() const {
        std::vector<std::string> result;
        for (auto& entry : m_decoder(m_blob)) {
            result.push_back(std::move(entry.name));
        }
        return result;
    }

    std::vector<uint8_t> blob_archive::extract(const std::string& name) const {
        auto entries = m_decoder(m_blob);
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&name](const archive_entry& e) { return e.name == name; });
        THROW_IF(it == entries.end(), font_not_found, "\"", name, "\" font not found.");
        return std::move(it->data);
    }

    // ========================================================================
    // directory_archive
    // ========================================================================

    directory_archive::directory_archive(std::filesystem::path dir)
        : m_dir(std::move(dir)) {
    }

    std::vector<std::string> directory_archive::names() const {
        THROW_IF(!std::filesystem::is_directory(m_dir), std::runtime_error,
                 "Font directory does not exist:", m_dir.string());

        std::vector<std::string> result;
        for (const auto& entry : std::filesystem::directory_iterator(m_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == FONT_EXTENSION) {
                result.push_back(entry.path().stem().string());
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<uint8_t> directory_archive::extract(const std::string& name) const {
        auto file = m_dir / (name + std::string(FONT_EXTENSION));
        THROW_IF(name.empty() || !std::filesystem::is_regular_file(file), font_not_found,
                 "\"", name, "\" font not found.");
        return internal::read_file(file);
    }

    const std::filesystem::path& directory_archive::path() const {
        return m_dir;
    }

    // ========================================================================
    // font_catalog
    // ========================================================================

    font_catalog::font_catalog(std::shared_ptr<const font_archive> archive)
        : m_archive(std::move(archive)) {
        THROW_IF(!m_archive, std::invalid_argument, "font_catalog requires an archive");
    }

    const std::vector<std::string>& font_catalog::list_names() const {
        if (!m_names) {
            m_names = m_archive->names();
            LOG_DEBUG("Font catalog lists ", m_names->size(), " fonts");
        }
        return *m_names;
    }

    bool font_catalog::has_font(std::string_view name) const {
        const auto& names = list_names();
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    std::string font_catalog::default_name() const {
        const auto& names = list_names();
        THROW_IF(names.empty(), font_not_found, "Font catalog is empty, no default font");
        return names.front();
    }

    std::string font_catalog::load_by_name(stroke_font& font, std::string_view name,
                                           const load_options& options) const {
        std::string resolved = name.empty() ? default_name() : std::string(name);
        THROW_IF(!has_font(resolved), font_not_found, "\"", resolved, "\" font not found.");

        auto data = m_archive->extract(resolved);
        font.load_bytes(data, options);
        LOG_INFO("Loaded font \"", resolved, "\" with ", font.glyph_count(), " glyphs");
        return resolved;
    }

}  // namespace hershey_font
