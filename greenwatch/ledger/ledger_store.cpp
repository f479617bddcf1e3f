#include "ledger_store.h"
#include "common/logging.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace GreenWatch::Ledger {

namespace {

auto sortBySequence(std::vector<LedgerEntry>* entries) -> void {
    std::stable_sort(entries->begin(), entries->end(), [](const LedgerEntry& a, const LedgerEntry& b) {
        return a.sequence_number < b.sequence_number;
    });
}

auto getString(const rapidjson::Value& obj, const char* key, std::string* out) -> bool {
    if (!obj.HasMember(key) || !obj[key].IsString()) return false;
    out->assign(obj[key].GetString(), obj[key].GetStringLength());
    return true;
}

} // namespace

// ============================================================================
// InMemoryLedgerStore
// ============================================================================

auto InMemoryLedgerStore::tail() const -> std::optional<LedgerTail> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) return std::nullopt;
    const auto it = std::max_element(entries_.begin(), entries_.end(),
        [](const LedgerEntry& a, const LedgerEntry& b) { return a.sequence_number < b.sequence_number; });
    return LedgerTail{it->sequence_number, it->entry_hash};
}

auto InMemoryLedgerStore::insert(const LedgerEntry& entry) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    return true;
}

auto InMemoryLedgerStore::readAll(std::vector<LedgerEntry>* out) const -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        *out = entries_;
    }
    sortBySequence(out);
    return true;
}

auto InMemoryLedgerStore::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// FileLedgerStore
// ============================================================================

FileLedgerStore::FileLedgerStore(std::string path) : path_(std::move(path)) {}

FileLedgerStore::~FileLedgerStore() {
    close();
}

auto FileLedgerStore::encodeLine(const LedgerEntry& entry) -> std::string {
    char created[48];
    Common::FastDateTime::formatIso8601(entry.created_at, created, sizeof(created));

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("id");
    writer.String(entry.id.c_str(), static_cast<rapidjson::SizeType>(entry.id.size()));
    writer.Key("sequence_number");
    writer.Uint64(entry.sequence_number);
    writer.Key("event_type");
    writer.String(entry.event_type.c_str(), static_cast<rapidjson::SizeType>(entry.event_type.size()));
    writer.Key("event_id");
    writer.String(entry.event_id.c_str(), static_cast<rapidjson::SizeType>(entry.event_id.size()));
    writer.Key("event_data");
    writer.String(entry.event_data.c_str(), static_cast<rapidjson::SizeType>(entry.event_data.size()));
    writer.Key("prev_hash");
    writer.String(entry.prev_hash.c_str(), static_cast<rapidjson::SizeType>(entry.prev_hash.size()));
    writer.Key("entry_hash");
    writer.String(entry.entry_hash.c_str(), static_cast<rapidjson::SizeType>(entry.entry_hash.size()));
    writer.Key("created_at");
    writer.String(created);
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

auto FileLedgerStore::decodeLine(const std::string& line, LedgerEntry* out) -> bool {
    rapidjson::Document doc;
    doc.Parse(line.c_str(), line.size());
    if (doc.HasParseError() || !doc.IsObject()) return false;

    if (!doc.HasMember("sequence_number") || !doc["sequence_number"].IsUint64()) return false;
    out->sequence_number = doc["sequence_number"].GetUint64();

    std::string created;
    if (!getString(doc, "id", &out->id) ||
        !getString(doc, "event_type", &out->event_type) ||
        !getString(doc, "event_id", &out->event_id) ||
        !getString(doc, "event_data", &out->event_data) ||
        !getString(doc, "prev_hash", &out->prev_hash) ||
        !getString(doc, "entry_hash", &out->entry_hash) ||
        !getString(doc, "created_at", &created)) {
        return false;
    }
    if (!Common::parseIso8601(created.c_str(), &out->created_at)) {
        out->created_at = 0;
    }
    return true;
}

auto FileLedgerStore::open() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) return true;

    tail_.reset();
    {
        std::ifstream in(path_);
        std::string line;
        std::string last;
        while (std::getline(in, line)) {
            if (!line.empty()) last = line;
        }
        if (!last.empty()) {
            LedgerEntry entry;
            if (!decodeLine(last, &entry)) {
                LOG_ERROR("Ledger file %s: last entry is unreadable; refusing to append", path_.c_str());
                return false;
            }
            tail_ = LedgerTail{entry.sequence_number, entry.entry_hash};
        }
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        LOG_ERROR("Failed to open ledger file %s: %s", path_.c_str(), strerror(errno));
        return false;
    }

    LOG_INFO("Ledger file %s opened, tail seq=%lu", path_.c_str(),
             tail_ ? static_cast<unsigned long>(tail_->sequence_number) : 0UL);
    return true;
}

auto FileLedgerStore::close() noexcept -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto FileLedgerStore::tail() const -> std::optional<LedgerTail> {
    std::lock_guard<std::mutex> lock(mutex_);
    return tail_;
}

auto FileLedgerStore::insert(const LedgerEntry& entry) -> bool {
    std::string line = encodeLine(entry);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        LOG_ERROR("Ledger file %s is not open", path_.c_str());
        return false;
    }

    size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Ledger write to %s failed at seq=%lu: %s", path_.c_str(),
                      static_cast<unsigned long>(entry.sequence_number), strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd_) != 0) {
        LOG_ERROR("Ledger fsync on %s failed at seq=%lu: %s", path_.c_str(),
                  static_cast<unsigned long>(entry.sequence_number), strerror(errno));
        return false;
    }

    tail_ = LedgerTail{entry.sequence_number, entry.entry_hash};
    return true;
}

auto FileLedgerStore::readAll(std::vector<LedgerEntry>* out) const -> bool {
    out->clear();
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path_);
    if (!in.is_open()) {
        // Nothing written yet
        return true;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        LedgerEntry entry;
        if (!decodeLine(line, &entry)) {
            LOG_ERROR("Ledger file %s: line %zu is not a ledger entry", path_.c_str(), line_no);
            return false;
        }
        out->push_back(std::move(entry));
    }
    sortBySequence(out);
    return true;
}

} // namespace GreenWatch::Ledger
