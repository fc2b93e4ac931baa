#include "oddity/core/AnimationPlayer.hh"
#include "oddity/utils/ErrorHandling.hh"

#include <cmath>

namespace oddity {

void AnimationPlayer::addClip(const std::string& key, AnimationClip clip) {
    clips_[key] = clip;
}

bool AnimationPlayer::hasClip(const std::string& key) const {
    return clips_.find(key) != clips_.end();
}

uint32_t AnimationPlayer::clipCount() const {
    return static_cast<uint32_t>(clips_.size());
}

void AnimationPlayer::play(const std::string& key, bool ignoreIfPlaying) {
    if (!hasClip(key)) {
        throwError("Unknown animation '" + key + "'");
    }
    if (ignoreIfPlaying && playing_ && current_ == key) {
        return;
    }
    current_ = key;
    playing_ = true;
    elapsedMs_ = 0.0f;
    frame_ = 0;
}

void AnimationPlayer::stop() {
    playing_ = false;
}

bool AnimationPlayer::isPlaying() const {
    return playing_;
}

std::optional<std::string> AnimationPlayer::currentKey() const {
    return current_;
}

uint32_t AnimationPlayer::currentFrame() const {
    return frame_;
}

void AnimationPlayer::update(float deltaMs) {
    if (!playing_ || !current_) {
        return;
    }
    const auto& clip = clips_.at(*current_);
    if (clip.frameRate <= 0.0f || clip.frameCount == 0) {
        return;
    }

    elapsedMs_ += deltaMs;
    auto advanced = static_cast<uint32_t>(std::floor(elapsedMs_ * clip.frameRate / 1000.0f));
    if (clip.loop) {
        frame_ = advanced % clip.frameCount;
    } else if (advanced >= clip.frameCount) {
        frame_ = clip.frameCount - 1;
        playing_ = false;
    } else {
        frame_ = advanced;
    }
}

} // namespace oddity
