#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace oddity {

struct AnimationClip {
    float frameRate = 10.0f;
    uint32_t frameCount = 1;
    bool loop = true;
};

// Sprite animation state: a registry of named clips and the one playing now.
class AnimationPlayer {
  public:
    void addClip(const std::string& key, AnimationClip clip = {});
    bool hasClip(const std::string& key) const;
    uint32_t clipCount() const;

    // Throws OddityException for an unknown key. With ignoreIfPlaying the
    // clip keeps its current frame when it is already running.
    void play(const std::string& key, bool ignoreIfPlaying = true);
    void stop();

    bool isPlaying() const;
    std::optional<std::string> currentKey() const;
    uint32_t currentFrame() const;

    void update(float deltaMs);

  private:
    std::unordered_map<std::string, AnimationClip> clips_;
    std::optional<std::string> current_;
    bool playing_ = false;
    float elapsedMs_ = 0.0f;
    uint32_t frame_ = 0;
};

} // namespace oddity
