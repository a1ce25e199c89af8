#include "committable_record.hpp"
#include "stream_errors.hpp"
#include <algorithm>
#include <cctype>

void CommittableRecord::checkpoint() const {
    if (!checkpoint_action) {
        throw CheckpointError("Shard " + shard_id + ": record " + record.sequence_number +
                              " has no checkpoint action");
    }

    try {
        checkpoint_action();
    } catch (const CheckpointError&) {
        throw;
    } catch (const std::exception& e) {
        throw CheckpointError("Shard " + shard_id + ": checkpoint at " + record.sequence_number +
                              "/" + std::to_string(record.sub_sequence_number) +
                              " failed: " + e.what());
    }
}

static bool isDecimal(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

static std::string stripLeadingZeros(const std::string& s) {
    size_t start = s.find_first_not_of('0');
    if (start == std::string::npos) {
        return "0";
    }
    return s.substr(start);
}

int SequenceNumberOrder::compare(const std::string& a, const std::string& b) {
    bool a_decimal = isDecimal(a);
    bool b_decimal = isDecimal(b);
    if (a_decimal != b_decimal) {
        // Decimals rank before any other text
        return a_decimal ? -1 : 1;
    }
    if (!a_decimal) {
        return a.compare(b);
    }

    std::string lhs = stripLeadingZeros(a);
    std::string rhs = stripLeadingZeros(b);
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    return lhs.compare(rhs);
}

int SequenceNumberOrder::compare(const Record& a, const Record& b) {
    int result = compare(a.sequence_number, b.sequence_number);
    if (result != 0) {
        return result;
    }
    if (a.sub_sequence_number == b.sub_sequence_number) {
        return 0;
    }
    return a.sub_sequence_number < b.sub_sequence_number ? -1 : 1;
}
