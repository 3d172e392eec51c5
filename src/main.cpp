#include "app/Application.hpp"

int main(int argc, char** argv)
{
    return provlens::app::Application{ argc, argv }.run();
}
