#include <new>

/// Entry point of the mdtouch executable.
int mainEntryMDTouch(int argc, char ** argv);

int main(int argc_, char ** argv_)
{
    /// Reset new handler to default (that throws std::bad_alloc)
    std::set_new_handler(nullptr);

    return mainEntryMDTouch(argc_, argv_);
}
