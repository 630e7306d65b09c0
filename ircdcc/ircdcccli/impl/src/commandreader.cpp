#include "commandreader.hpp"

#include <cctype>

namespace ircdcccli
{
CommandReader::CommandReader(std::istream &input)
    : input_ {input}
{}

Command CommandReader::read_next_command() const
{
    std::string              input_line;
    std::vector<std::string> tokens;
    do
    {
        if (!std::getline(input_, input_line))
        {
            return {};
        }
        tokens = split(input_line);
    } while (tokens.empty());

    return {tokens.front(), tokens.cbegin() + 1, tokens.cend()};
}

std::vector<std::string> CommandReader::split(const std::string &line)
{
    std::vector<std::string> tokens;
    std::string              token;
    bool        in_token  = false;
    bool        in_quotes = false;

    for (size_t i = 0; i != line.size(); ++i)
    {
        char c = line[i];
        if (in_quotes)
        {
            if (c == '\\' && i + 1 != line.size())
            {
                token.push_back(line[++i]);
            }
            else if (c == '"')
            {
                in_quotes = false;
            }
            else
            {
                token.push_back(c);
            }
        }
        else if (c == '"')
        {
            in_quotes = true;
            in_token  = true;
        }
        else if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (in_token)
            {
                tokens.push_back(std::move(token));
                token.clear();
                in_token = false;
            }
        }
        else
        {
            token.push_back(c);
            in_token = true;
        }
    }

    if (in_token)
    {
        tokens.push_back(std::move(token));
    }
    return tokens;
}
}  // namespace ircdcccli
