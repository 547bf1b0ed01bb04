#include "../../include/wire_codec.hpp"

namespace crusher {

    namespace {

    class Writer {
    public:
        explicit Writer(const FrameType type) {
            u8(kWireMagic);
            u8(static_cast<std::uint8_t>(type));
        }

        void u8(const std::uint8_t v) { out_.push_back(static_cast<char>(v)); }

        void u32(const std::uint32_t v) {
            for (int i = 0; i < 4; ++i) u8(static_cast<std::uint8_t>(v >> (8 * i)));
        }

        void u64(const std::uint64_t v) {
            for (int i = 0; i < 8; ++i) u8(static_cast<std::uint8_t>(v >> (8 * i)));
        }

        void str(const std::string_view s) {
            u32(static_cast<std::uint32_t>(s.size()));
            out_.append(s);
        }

        std::string take() { return std::move(out_); }

    private:
        std::string out_;
    };

    class Reader {
    public:
        Reader(const std::string_view in, const FrameType expected) : in_(in) {
            if (frame_type(in) != expected) {
                throw ProtocolError("unexpected frame type");
            }
            pos_ = 2;
        }

        std::uint8_t u8() {
            need(1);
            return static_cast<std::uint8_t>(in_[pos_++]);
        }

        std::uint32_t u32() {
            need(4);
            std::uint32_t v = 0;
            for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(in_[pos_++])) << (8 * i);
            return v;
        }

        std::uint64_t u64() {
            need(8);
            std::uint64_t v = 0;
            for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(in_[pos_++])) << (8 * i);
            return v;
        }

        bool boolean() {
            const auto v = u8();
            if (v > 1) throw ProtocolError("invalid boolean");
            return v == 1;
        }

        std::string str() {
            const std::uint32_t len = u32();
            need(len);
            std::string s(in_.substr(pos_, len));
            pos_ += len;
            return s;
        }

        void finish() const {
            if (pos_ != in_.size()) throw ProtocolError("trailing bytes in frame");
        }

    private:
        void need(const std::size_t n) const {
            if (in_.size() - pos_ < n) throw ProtocolError("truncated frame");
        }

        std::string_view in_;
        std::size_t pos_ = 0;
    };

    void write_request(Writer& w, const Task& task) {
        w.str(task.id);
        w.u32(static_cast<std::uint32_t>(task.engines.size()));
        for (const auto& e : task.engines) w.str(e);
        w.str(task.extension);
        w.str(task.content);
        w.u8(task.gzip ? 1 : 0);
    }

    Task read_request(Reader& r) {
        Task task;
        task.id = r.str();
        const std::uint32_t n = r.u32();
        for (std::uint32_t i = 0; i < n; ++i) task.engines.push_back(r.str());
        task.extension = r.str();
        task.content = r.str();
        task.gzip = r.boolean();
        return task;
    }

    } // namespace

    FrameType frame_type(const std::string_view payload) {
        if (payload.size() < 2 || static_cast<std::uint8_t>(payload[0]) != kWireMagic) {
            throw ProtocolError("bad frame header");
        }
        const auto type = static_cast<std::uint8_t>(payload[1]);
        if (type != static_cast<std::uint8_t>(FrameType::Task) &&
            type != static_cast<std::uint8_t>(FrameType::Reply)) {
            throw ProtocolError("unknown frame type");
        }
        return static_cast<FrameType>(type);
    }

    std::string encode_task(const Task& task) {
        Writer w(FrameType::Task);
        write_request(w, task);
        return w.take();
    }

    Task decode_task(const std::string_view payload) {
        Reader r(payload, FrameType::Task);
        Task task = read_request(r);
        r.finish();
        return task;
    }

    std::string encode_reply(const Reply& reply) {
        Writer w(FrameType::Reply);
        w.u8(reply.error ? 1 : 0);
        if (reply.error) {
            w.u8(static_cast<std::uint8_t>(reply.error->kind));
            w.str(reply.error->message);
        }

        const Task& task = reply.task;
        write_request(w, task);
        w.u64(static_cast<std::uint64_t>(task.duration.count()));
        w.u32(static_cast<std::uint32_t>(task.individual.size()));
        for (const auto& [name, ms] : task.individual) {
            w.str(name);
            w.u64(static_cast<std::uint64_t>(ms.count()));
        }
        w.u8(task.gzip_size ? 1 : 0);
        if (task.gzip_size) w.u64(*task.gzip_size);
        return w.take();
    }

    Reply decode_reply(const std::string_view payload) {
        Reader r(payload, FrameType::Reply);
        Reply reply;
        if (r.boolean()) {
            const auto kind = error_kind_from_wire(r.u8());
            if (!kind) throw ProtocolError("unknown error kind");
            reply.error = TaskError{*kind, r.str()};
        }

        reply.task = read_request(r);
        Task& task = reply.task;
        task.duration = std::chrono::milliseconds(static_cast<long long>(r.u64()));
        const std::uint32_t n = r.u32();
        for (std::uint32_t i = 0; i < n; ++i) {
            std::string name = r.str();
            task.individual[std::move(name)] = std::chrono::milliseconds(static_cast<long long>(r.u64()));
        }
        if (r.boolean()) task.gzip_size = r.u64();
        r.finish();
        return reply;
    }

} // namespace crusher
