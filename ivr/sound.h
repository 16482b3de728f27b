#ifndef _SOUND_H_
#define _SOUND_H_

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace ivr {

// A playable prompt: file name relative to the sounds directory and its
// nominal length.
class Sound
{
public:
    Sound(std::string path, unsigned duration_sec);

    const std::string &path() const { return path_; }
    std::chrono::seconds duration() const { return duration_; }

    bool operator==(const Sound &other) const { return path_ == other.path_; }
    bool operator!=(const Sound &other) const { return !(*this == other); }

private:
    std::string path_;
    std::chrono::seconds duration_;
};

namespace sounds {

const Sound &welcome();
const Sound &explanation();
const Sound &numbersNotFound();

const Sound &zero();
const Sound &one();
const Sound &two();
const Sound &three();
const Sound &four();
const Sound &five();
const Sound &six();
const Sound &seven();
const Sound &eight();
const Sound &nine();

// zero() .. nine(), indexed by digit value.
const std::vector<Sound> &digits();

std::map<char, Sound> digitMap();

// Returns nullptr for anything but '0'..'9'.
const Sound *forDigit(char key);

} // namespace sounds

std::string
joinPath(const std::string &dir, const std::string &file);

} // namespace ivr

#endif // _SOUND_H_
