#include "app.hh"
#include <iostream>

int main()
{
    try
    {
        app a;
        for(;;)
        {
            if(!a.handle_input())
                break;
            a.update();
            a.render();
        }
    }
    catch(const std::exception& e)
    {
        std::cerr << "chipview: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
