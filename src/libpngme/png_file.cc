//
// PNG file: signature plus chunk list.
//

#include <algorithm>
#include <fstream>
#include <istream>
#include <ostream>

#include <pngme/png_file.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    png_file::png_file(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png_file png_file::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    png_file png_file::parse(const void* data, std::size_t size, const parse_options& options) {
        THROW_PARSE_IF(size < png_signature.size(), too_short,
                       "PNG file needs at least ", png_signature.size(), " signature bytes, got ", size);
        THROW_PARSE_UNLESS(has_png_signature(data, size), invalid_signature,
                           "Buffer does not start with the PNG signature");

        std::vector<chunk> chunks;
        chunk_iterator it(data, size, png_signature.size(), options);
        while (it.has_next()) {
            chunks.push_back(it.current().record);
            it.next();
        }
        return png_file(std::move(chunks));
    }

    png_file png_file::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes.data(), bytes.size(), parse_options{});
    }

    png_file png_file::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    png_file png_file::load(std::istream& stream) {
        return load(stream, parse_options{});
    }

    png_file png_file::load(std::istream& stream, const parse_options& options) {
        THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        std::vector<std::byte> bytes;
        std::array<char, 4096> buffer;
        while (stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || stream.gcount() > 0) {
            const auto* p = reinterpret_cast<const std::byte*>(buffer.data());
            bytes.insert(bytes.end(), p, p + stream.gcount());
        }
        THROW_IO_IF(stream.bad(), "Stream read failed after ", bytes.size(), " bytes");

        return parse(bytes, options);
    }

    png_file png_file::load(const std::filesystem::path& path) {
        return load(path, parse_options{});
    }

    png_file png_file::load(const std::filesystem::path& path, const parse_options& options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "'");
        return load(file, options);
    }

    const std::array<std::uint8_t, 8>& png_file::header() const {
        return png_signature;
    }

    void png_file::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png_file::remove_first_chunk(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        THROW_PARSE_IF(it == m_chunks.end(), chunk_not_found, "No chunk of type ", type, " in file");

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png_file::chunk_by_type(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png_file::serialize() const {
        std::vector<std::byte> out;
        std::size_t total = png_signature.size();
        for (const auto& c : m_chunks) {
            total += chunk::overhead + c.length();
        }
        out.reserve(total);

        const auto* sig = reinterpret_cast<const std::byte*>(png_signature.data());
        out.insert(out.end(), sig, sig + png_signature.size());
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

    void png_file::save(std::ostream& stream) const {
        const auto bytes = serialize();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(stream, "Failed to write ", bytes.size(), " bytes");
    }

    void png_file::save(const std::filesystem::path& path) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "' for writing");
        save(file);
    }

} // namespace pngme
