#include <tether/engine.hpp>
#include <tether/rocks_store.hpp>

#include <iostream>

namespace {

struct Book;

struct Author : tether::ModelOf<Author> {
  std::string name;
  std::vector<tether::Ref<Book>> books;

  static const tether::TypeDescriptor& Type();
};

struct Book : tether::ModelOf<Book> {
  std::string title;
  int64_t year = 0;
  tether::Ref<Author> author;

  static const tether::TypeDescriptor& Type();
};

const tether::TypeDescriptor& Author::Type() {
  static const tether::TypeDescriptor type = tether::TypeBuilder<Author>("Author")
      .Field("name", &Author::name)
      .Field("books", &Author::books)
      .Build();
  return type;
}

const tether::TypeDescriptor& Book::Type() {
  static const tether::TypeDescriptor type = tether::TypeBuilder<Book>("Book")
      .Field("title", &Book::title)
      .Field("year", &Book::year)
      .Field("author", &Book::author)
      .Build();
  return type;
}

}  // namespace

int main() {
  std::unique_ptr<tether::RocksRecordStore> store;
  auto rs = tether::RocksRecordStore::Open("./tether_db", &store);
  if (!rs.ok()) {
    std::cerr << "Open failed: " << rs.ToString() << "\n";
    return 1;
  }

  tether::Options opt;
  std::unique_ptr<tether::Engine> engine;
  auto s = tether::Engine::Open(std::move(store), opt, &engine);
  if (!s.ok()) {
    std::cerr << "Engine open failed: " << s.ToString() << "\n";
    return 1;
  }

  tether::ObjectGraph graph;
  auto author = graph.Add(Author{});
  graph.Get(author)->name = "Ursula";

  // Book -> Author -> [Book]: a cycle through a reference list.
  Book book;
  book.title = "The Dispossessed";
  book.year = 1974;
  book.author = author;
  auto b = graph.Add(std::move(book));

  // The author is saved first (with its book list still empty), then the book.
  s = engine->Save(graph, author);
  if (!s.ok()) std::cerr << "Save author failed: " << s.ToString() << "\n";

  graph.Get(author)->books.push_back(b);
  s = engine->Save(graph, author);
  if (!s.ok()) {
    std::cerr << "Save author with books failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "author=" << *graph.Identity(author) << " book=" << *graph.Identity(b) << "\n";

  // Load into a fresh graph. The cycle comes back as a cycle.
  tether::ObjectGraph loaded;
  tether::Ref<Author> again;
  s = engine->Load(loaded, *graph.Identity(author), &again);
  if (!s.ok()) {
    std::cerr << "Load failed: " << s.ToString() << "\n";
    return 1;
  }
  const Author* a = loaded.Get(again);
  for (auto ref : a->books) {
    const Book* loaded_book = loaded.Get(ref);
    std::cout << a->name << " wrote " << loaded_book->title << " (" << loaded_book->year
              << "), back-reference intact: " << (loaded_book->author == again) << "\n";
  }

  s = engine->DeleteCascade(graph, author);
  if (!s.ok()) std::cerr << "Delete failed: " << s.ToString() << "\n";

  std::cout << "done\n";
  return 0;
}
