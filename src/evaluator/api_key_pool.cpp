#include "evaluator/api_key_pool.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace codegrade {
using namespace std;

api_key_pool::api_key_pool(vector<string> keys, chrono::milliseconds cooldown)
    : keys(move(keys)), cooldown(cooldown) {}

bool api_key_pool::resting(const string &key, chrono::steady_clock::time_point now) const {
    auto it = failures.find(key);
    return it != failures.end() && now - it->second < cooldown;
}

optional<string> api_key_pool::next_key() {
    lock_guard<mutex> lock(mut);
    if (keys.empty()) return nullopt;

    auto now = chrono::steady_clock::now();
    for (size_t attempt = 0; attempt < keys.size(); ++attempt) {
        const string &key = keys[current];
        if (!resting(key, now)) {
            failures.erase(key);
            return key;
        }
        current = (current + 1) % keys.size();
    }

    // all keys rest, the one failed longest ago is the most likely to work
    auto oldest = failures.begin();
    for (auto it = failures.begin(); it != failures.end(); ++it)
        if (it->second < oldest->second) oldest = it;
    return oldest->first;
}

void api_key_pool::mark_failed(const string &key) {
    lock_guard<mutex> lock(mut);
    auto it = find(keys.begin(), keys.end(), key);
    if (it == keys.end()) return;
    failures[key] = chrono::steady_clock::now();
    current = (it - keys.begin() + 1) % keys.size();
    LOG(WARNING) << "API key " << mask_key(key) << " marked as failed (" << failures.size() << "/" << keys.size() << " failed)";
}

size_t api_key_pool::size() const {
    lock_guard<mutex> lock(mut);
    return keys.size();
}

size_t api_key_pool::failed() const {
    lock_guard<mutex> lock(mut);
    auto now = chrono::steady_clock::now();
    size_t count = 0;
    for (auto &key : keys)
        if (resting(key, now)) ++count;
    return count;
}

string mask_key(const string &key) {
    return key.substr(0, min<size_t>(key.size(), 10)) + "...";
}

}  // namespace codegrade
