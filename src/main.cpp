#include "hotspot_window.hpp"

#include <gtkmm.h>

int main(int argc, char* argv[])
{
  auto app = Gtk::Application::create("io.github.idkspot");
  return app->make_window_and_run<HotspotWindow>(argc, argv);
}
