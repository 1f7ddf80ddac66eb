#include "logo.hpp"

namespace tad::utils
{
    const std::string & getLogo(LogoASCII_t)
    {
        static const std::string logo =
            "\n"
            "  _____                 _        _             _     _           \n"
            " |_   _|_      _____  _| |_     / \\   _ __ ___| |__ (_)_   _____ \n"
            "   | | \\ \\ /\\ / / _ \\/ _ \\ __| / _ \\ | '__/ __| '_ \\| \\ \\ / / _ \\\n"
            "   | |  \\ V  V /  __/  __/ |_ / ___ \\| | | (__| | | | |\\ V /  __/\n"
            "   |_|   \\_/\\_/ \\___|\\___|\\__/_/   \\_\\_|  \\___|_| |_|_| \\_/ \\___|\n"
            "                                                   daemon\n\n";
        return logo;
    }

    const std::string & getLogo(LogoUnicode_t)
    {
        static const std::string logo =
            "\n"
            "  ╔╦╗┬ ┬┌─┐┌─┐┌┬┐  ╔═╗┬─┐┌─┐┬ ┬┬┬  ┬┌─┐\n"
            "   ║ │││├┤ ├┤  │   ╠═╣├┬┘│  ├─┤│└┐┌┘├┤ \n"
            "   ╩ └┴┘└─┘└─┘ ┴   ╩ ╩┴└─└─┘┴ ┴┴ └┘ └─┘\n"
            "                             daemon\n\n";
        return logo;
    }
}
