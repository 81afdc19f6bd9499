#include "application.hh"
#include "mainwindow.hh"


int main(int argc, char *argv[])
{
  Application app(argc, argv);

  MainWindow window(app);
  window.show();

  return app.exec();
}
