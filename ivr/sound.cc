#include "sound.h"

#include <utility>

ivr::Sound::Sound(std::string path, unsigned duration_sec) :
    path_(std::move(path)),
    duration_(duration_sec)
{
}

const ivr::Sound &ivr::sounds::welcome()
{
    static const Sound sound("welcome.wav", 5);
    return sound;
}

const ivr::Sound &ivr::sounds::explanation()
{
    static const Sound sound("explanation.wav", 10);
    return sound;
}

const ivr::Sound &ivr::sounds::numbersNotFound()
{
    static const Sound sound("numbers-not-found.wav", 5);
    return sound;
}

const ivr::Sound &ivr::sounds::zero()
{
    return digits()[0];
}

const ivr::Sound &ivr::sounds::one()
{
    return digits()[1];
}

const ivr::Sound &ivr::sounds::two()
{
    return digits()[2];
}

const ivr::Sound &ivr::sounds::three()
{
    return digits()[3];
}

const ivr::Sound &ivr::sounds::four()
{
    return digits()[4];
}

const ivr::Sound &ivr::sounds::five()
{
    return digits()[5];
}

const ivr::Sound &ivr::sounds::six()
{
    return digits()[6];
}

const ivr::Sound &ivr::sounds::seven()
{
    return digits()[7];
}

const ivr::Sound &ivr::sounds::eight()
{
    return digits()[8];
}

const ivr::Sound &ivr::sounds::nine()
{
    return digits()[9];
}

const std::vector<ivr::Sound> &ivr::sounds::digits()
{
    static const std::vector<Sound> all {
        Sound("zero.wav", 5),
        Sound("one.wav", 5),
        Sound("two.wav", 5),
        Sound("three.wav", 5),
        Sound("four.wav", 5),
        Sound("five.wav", 5),
        Sound("six.wav", 5),
        Sound("seven.wav", 5),
        Sound("eight.wav", 5),
        Sound("nine.wav", 5),
    };
    return all;
}

std::map<char, ivr::Sound> ivr::sounds::digitMap()
{
    std::map<char, Sound> map;
    const auto &all = digits();
    for (std::size_t i = 0; i < all.size(); ++i) {
        map.emplace(static_cast<char>('0' + i), all[i]);
    }
    return map;
}

const ivr::Sound *ivr::sounds::forDigit(char key)
{
    if (key < '0' || key > '9') {
        return nullptr;
    }
    return &digits()[key - '0'];
}

std::string ivr::joinPath(const std::string &dir, const std::string &file)
{
    if (dir.empty() || file.empty() || file[0] == '/') {
        return file;
    }
    if (dir[dir.size() - 1] == '/') {
        return dir + file;
    }
    return dir + "/" + file;
}
