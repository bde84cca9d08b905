#ifndef CODEC_ERROR_HPP
#define CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

class CodecError : public std::runtime_error
{
public:
    explicit CodecError(const std::string &what) : std::runtime_error(what) {}
};

class FrameTooLarge : public CodecError
{
public:
    explicit FrameTooLarge(const std::string &what) : CodecError(what) {}
};

class MalformedEnvelope : public CodecError
{
public:
    explicit MalformedEnvelope(const std::string &what) : CodecError(what) {}
};

#endif
