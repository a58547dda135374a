#include <quarry/runtime/wire.hpp>

#include <fmt/core.h>

#include <bit>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace quarry::runtime {

namespace {

enum class MessageKind : std::uint8_t {
    Request = 1,
    Response = 2,
};

enum class ValueTag : std::uint8_t {
    Null = 0,
    Bool = 1,
    Int = 2,
    BigInt = 3,
    Double = 4,
    String = 5,
};

class Writer {
   public:
    explicit Writer(MessageKind kind) {
        u32(kWireMagic);
        u16(kWireVersion);
        u8(static_cast<std::uint8_t>(kind));
    }

    void u8(std::uint8_t value) { out_.push_back(value); }

    void u16(std::uint16_t value) {
        out_.push_back(static_cast<std::uint8_t>(value));
        out_.push_back(static_cast<std::uint8_t>(value >> 8));
    }

    void u32(std::uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            out_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void u64(std::uint64_t value) {
        for (int shift = 0; shift < 64; shift += 8) {
            out_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void length(std::size_t size) {
        auto checked = wire_length(size);
        if (!checked) {
            if (!error_.has_value()) {
                error_ = std::move(checked.error());
            }
            return;
        }
        u32(*checked);
    }

    void string(const std::string& text) {
        length(text.size());
        out_.insert(out_.end(), text.begin(), text.end());
    }

    void value(const Value& value) {
        std::visit(
            [this](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    u8(static_cast<std::uint8_t>(ValueTag::Null));
                } else if constexpr (std::is_same_v<T, bool>) {
                    u8(static_cast<std::uint8_t>(ValueTag::Bool));
                    u8(v ? 1 : 0);
                } else if constexpr (std::is_same_v<T, std::int32_t>) {
                    u8(static_cast<std::uint8_t>(ValueTag::Int));
                    u32(static_cast<std::uint32_t>(v));
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    u8(static_cast<std::uint8_t>(ValueTag::BigInt));
                    u64(static_cast<std::uint64_t>(v));
                } else if constexpr (std::is_same_v<T, double>) {
                    u8(static_cast<std::uint8_t>(ValueTag::Double));
                    u64(std::bit_cast<std::uint64_t>(v));
                } else {
                    u8(static_cast<std::uint8_t>(ValueTag::String));
                    string(v);
                }
            },
            value);
    }

    void row(const Row& row) {
        length(row.size());
        for (const auto& v : row) {
            value(v);
        }
    }

    void rows(const std::vector<Row>& rows) {
        length(rows.size());
        for (const auto& r : rows) {
            row(r);
        }
    }

    auto finish() && -> Result<Bytes> {
        if (error_.has_value()) {
            return std::unexpected(std::move(*error_));
        }
        return std::move(out_);
    }

   private:
    Bytes out_;
    std::optional<Error> error_;
};

/// Bounds-checked reader; every accessor fails with a Codec error on truncation.
class Reader {
   public:
    explicit Reader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

    auto header(MessageKind expected) -> Status {
        auto magic = u32();
        if (!magic) {
            return std::unexpected(magic.error());
        }
        if (*magic != kWireMagic) {
            return fail(fmt::format("bad magic 0x{:08x}", *magic));
        }
        auto version = u16();
        if (!version) {
            return std::unexpected(version.error());
        }
        if (*version != kWireVersion) {
            return fail(fmt::format("unsupported wire version {}", *version));
        }
        auto kind = u8();
        if (!kind) {
            return std::unexpected(kind.error());
        }
        if (*kind != static_cast<std::uint8_t>(expected)) {
            return fail(fmt::format("unexpected message kind {}", *kind));
        }
        return {};
    }

    auto u8() -> Result<std::uint8_t> {
        if (auto status = need(1); !status) {
            return std::unexpected(status.error());
        }
        return bytes_[pos_++];
    }

    auto u16() -> Result<std::uint16_t> {
        if (auto status = need(2); !status) {
            return std::unexpected(status.error());
        }
        const auto value = static_cast<std::uint16_t>(bytes_[pos_] | (bytes_[pos_ + 1] << 8));
        pos_ += 2;
        return value;
    }

    auto u32() -> Result<std::uint32_t> {
        if (auto status = need(4); !status) {
            return std::unexpected(status.error());
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<std::uint32_t>(bytes_[pos_++]) << (8 * i);
        }
        return value;
    }

    auto u64() -> Result<std::uint64_t> {
        if (auto status = need(8); !status) {
            return std::unexpected(status.error());
        }
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<std::uint64_t>(bytes_[pos_++]) << (8 * i);
        }
        return value;
    }

    auto string() -> Result<std::string> {
        auto size = u32();
        if (!size) {
            return std::unexpected(size.error());
        }
        if (auto status = need(*size); !status) {
            return std::unexpected(status.error());
        }
        std::string text(reinterpret_cast<const char*>(bytes_.data() + pos_), *size);
        pos_ += *size;
        return text;
    }

    auto value() -> Result<Value> {
        auto tag = u8();
        if (!tag) {
            return std::unexpected(tag.error());
        }
        switch (static_cast<ValueTag>(*tag)) {
            case ValueTag::Null:
                return Value{};
            case ValueTag::Bool: {
                auto flag = u8();
                if (!flag) {
                    return std::unexpected(flag.error());
                }
                return Value{*flag != 0};
            }
            case ValueTag::Int: {
                auto raw = u32();
                if (!raw) {
                    return std::unexpected(raw.error());
                }
                return Value{static_cast<std::int32_t>(*raw)};
            }
            case ValueTag::BigInt: {
                auto raw = u64();
                if (!raw) {
                    return std::unexpected(raw.error());
                }
                return Value{static_cast<std::int64_t>(*raw)};
            }
            case ValueTag::Double: {
                auto raw = u64();
                if (!raw) {
                    return std::unexpected(raw.error());
                }
                return Value{std::bit_cast<double>(*raw)};
            }
            case ValueTag::String: {
                auto text = string();
                if (!text) {
                    return std::unexpected(text.error());
                }
                return Value{std::move(*text)};
            }
        }
        return fail(fmt::format("unknown value tag {}", *tag));
    }

    auto row() -> Result<Row> {
        auto width = u32();
        if (!width) {
            return std::unexpected(width.error());
        }
        // Every value takes at least its tag byte.
        if (auto status = need(*width); !status) {
            return std::unexpected(status.error());
        }
        Row row;
        row.reserve(*width);
        for (std::uint32_t i = 0; i < *width; ++i) {
            auto v = value();
            if (!v) {
                return std::unexpected(v.error());
            }
            row.push_back(std::move(*v));
        }
        return row;
    }

    auto rows() -> Result<std::vector<Row>> {
        auto count = u32();
        if (!count) {
            return std::unexpected(count.error());
        }
        if (auto status = need(*count); !status) {
            return std::unexpected(status.error());
        }
        std::vector<Row> rows;
        rows.reserve(*count);
        for (std::uint32_t i = 0; i < *count; ++i) {
            auto r = row();
            if (!r) {
                return std::unexpected(r.error());
            }
            rows.push_back(std::move(*r));
        }
        return rows;
    }

    auto finish() const -> Status {
        if (pos_ != bytes_.size()) {
            return fail(fmt::format("{} trailing byte(s)", bytes_.size() - pos_));
        }
        return {};
    }

   private:
    auto need(std::size_t count) const -> Status {
        if (bytes_.size() - pos_ < count) {
            return fail(fmt::format("truncated message at byte {}", pos_));
        }
        return {};
    }

    static auto fail(std::string message) -> std::unexpected<Error> {
        return std::unexpected(make_error(ErrorCode::Codec, std::move(message)));
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_ = 0;
};

auto codec_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorCode::Codec, std::move(message)));
}

}  // namespace

auto wire_length(std::size_t size) -> Result<std::uint32_t> {
    if (size > std::numeric_limits<std::uint32_t>::max()) {
        return codec_error(fmt::format("length {} does not fit a u32 prefix", size));
    }
    return static_cast<std::uint32_t>(size);
}

auto encode_request(const SubRequest& request) -> Result<Bytes> {
    Writer out(MessageKind::Request);
    out.string(request.sql);
    out.row(request.args);
    out.u32(request.partition);
    out.u8(static_cast<std::uint8_t>(request.fragment));
    out.u32(request.fragment_table);
    out.length(request.broadcast.size());
    for (const auto& rows : request.broadcast) {
        out.rows(rows);
    }
    return std::move(out).finish();
}

auto decode_request(std::span<const std::uint8_t> bytes) -> Result<SubRequest> {
    Reader in(bytes);
    if (auto status = in.header(MessageKind::Request); !status) {
        return std::unexpected(status.error());
    }
    SubRequest request;
    auto sql = in.string();
    if (!sql) {
        return std::unexpected(sql.error());
    }
    request.sql = std::move(*sql);
    auto args = in.row();
    if (!args) {
        return std::unexpected(args.error());
    }
    request.args = std::move(*args);
    auto partition = in.u32();
    if (!partition) {
        return std::unexpected(partition.error());
    }
    request.partition = *partition;
    auto fragment = in.u8();
    if (!fragment) {
        return std::unexpected(fragment.error());
    }
    if (*fragment > static_cast<std::uint8_t>(FragmentKind::Broadcast)) {
        return codec_error(fmt::format("unknown fragment kind {}", *fragment));
    }
    request.fragment = static_cast<FragmentKind>(*fragment);
    auto table = in.u32();
    if (!table) {
        return std::unexpected(table.error());
    }
    request.fragment_table = *table;
    auto steps = in.u32();
    if (!steps) {
        return std::unexpected(steps.error());
    }
    for (std::uint32_t i = 0; i < *steps; ++i) {
        auto rows = in.rows();
        if (!rows) {
            return std::unexpected(rows.error());
        }
        request.broadcast.push_back(std::move(*rows));
    }
    if (auto status = in.finish(); !status) {
        return std::unexpected(status.error());
    }
    return request;
}

auto encode_response(const Result<SubResponse>& response) -> Result<Bytes> {
    Writer out(MessageKind::Response);
    if (!response) {
        out.u8(1);
        out.u8(static_cast<std::uint8_t>(response.error().code));
        out.string(response.error().message);
        out.string(response.error().context);
        return std::move(out).finish();
    }
    out.u8(0);
    out.rows(response->rows);
    out.length(response->groups.size());
    for (const auto& group : response->groups) {
        out.row(group.key);
        out.length(group.states.size());
        for (const auto& state : group.states) {
            out.u64(static_cast<std::uint64_t>(state.count));
            out.value(state.sum);
            out.value(state.min);
            out.value(state.max);
        }
    }
    return std::move(out).finish();
}

auto decode_response(std::span<const std::uint8_t> bytes) -> Result<SubResponse> {
    Reader in(bytes);
    if (auto status = in.header(MessageKind::Response); !status) {
        return std::unexpected(status.error());
    }
    auto status_byte = in.u8();
    if (!status_byte) {
        return std::unexpected(status_byte.error());
    }
    if (*status_byte == 1) {
        auto code = in.u8();
        if (!code) {
            return std::unexpected(code.error());
        }
        if (*code > static_cast<std::uint8_t>(ErrorCode::Codec)) {
            return codec_error(fmt::format("unknown error code {}", *code));
        }
        auto message = in.string();
        if (!message) {
            return std::unexpected(message.error());
        }
        auto context = in.string();
        if (!context) {
            return std::unexpected(context.error());
        }
        if (auto done = in.finish(); !done) {
            return std::unexpected(done.error());
        }
        return std::unexpected(make_error(static_cast<ErrorCode>(*code), std::move(*message),
                                          std::move(*context)));
    }
    if (*status_byte != 0) {
        return codec_error(fmt::format("unknown response status {}", *status_byte));
    }

    SubResponse response;
    auto rows = in.rows();
    if (!rows) {
        return std::unexpected(rows.error());
    }
    response.rows = std::move(*rows);
    auto groups = in.u32();
    if (!groups) {
        return std::unexpected(groups.error());
    }
    for (std::uint32_t g = 0; g < *groups; ++g) {
        GroupPartial group;
        auto key = in.row();
        if (!key) {
            return std::unexpected(key.error());
        }
        group.key = std::move(*key);
        auto states = in.u32();
        if (!states) {
            return std::unexpected(states.error());
        }
        for (std::uint32_t s = 0; s < *states; ++s) {
            AggState state;
            auto count = in.u64();
            if (!count) {
                return std::unexpected(count.error());
            }
            state.count = static_cast<std::int64_t>(*count);
            for (Value* slot : {&state.sum, &state.min, &state.max}) {
                auto v = in.value();
                if (!v) {
                    return std::unexpected(v.error());
                }
                *slot = std::move(*v);
            }
            group.states.push_back(std::move(state));
        }
        response.groups.push_back(std::move(group));
    }
    if (auto done = in.finish(); !done) {
        return std::unexpected(done.error());
    }
    return response;
}

}  // namespace quarry::runtime
